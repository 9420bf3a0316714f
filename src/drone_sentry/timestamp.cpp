#include "drone_sentry/timestamp.hpp"

#include <cctype>
#include <charconv>
#include <ctime>

#include <fmt/format.h>

namespace drone_sentry {

namespace {

struct SplitTime final {
    std::tm calendar{};
    long microseconds{};
};

SplitTime split(WallClock::time_point time_point) {
    const auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(time_point.time_since_epoch());
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = since_epoch - std::chrono::duration_cast<std::chrono::microseconds>(seconds);
    if (micros.count() < 0) {
        seconds -= std::chrono::seconds{1};
        micros += std::chrono::seconds{1};
    }
    const std::time_t raw_seconds = static_cast<std::time_t>(seconds.count());
    SplitTime split_time{};
    gmtime_r(&raw_seconds, &split_time.calendar);
    split_time.microseconds = static_cast<long>(micros.count());
    return split_time;
}

bool read_digits(std::string_view text, std::size_t& position, std::size_t count, int& out_value) {
    if (position + count > text.size()) {
        return false;
    }
    const char* first = text.data() + position;
    const char* last = first + count;
    const auto [ptr, error_code] = std::from_chars(first, last, out_value);
    if (error_code != std::errc{} || ptr != last) {
        return false;
    }
    position += count;
    return true;
}

bool expect(std::string_view text, std::size_t& position, char expected) {
    if (position >= text.size() || text[position] != expected) {
        return false;
    }
    ++position;
    return true;
}

}  // namespace

std::string format_iso8601(WallClock::time_point time_point) {
    const SplitTime split_time = split(time_point);
    const std::tm& tm = split_time.calendar;
    return fmt::format(
        "{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:06d}+00:00",
        tm.tm_year + 1900,
        tm.tm_mon + 1,
        tm.tm_mday,
        tm.tm_hour,
        tm.tm_min,
        tm.tm_sec,
        split_time.microseconds
    );
}

std::string now_iso8601() {
    return format_iso8601(WallClock::now());
}

std::optional<WallClock::time_point> parse_iso8601(std::string_view text) {
    std::size_t position = 0;
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!read_digits(text, position, 4, year) || !expect(text, position, '-')
        || !read_digits(text, position, 2, month) || !expect(text, position, '-')
        || !read_digits(text, position, 2, day)) {
        return std::nullopt;
    }
    if (position >= text.size() || (text[position] != 'T' && text[position] != ' ')) {
        return std::nullopt;
    }
    ++position;
    if (!read_digits(text, position, 2, hour) || !expect(text, position, ':')
        || !read_digits(text, position, 2, minute) || !expect(text, position, ':')
        || !read_digits(text, position, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    long microseconds = 0;
    if (position < text.size() && text[position] == '.') {
        ++position;
        long scale = 100000;
        std::size_t digits = 0;
        while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
            if (digits < 6) {
                microseconds += (text[position] - '0') * scale;
                scale /= 10;
            }
            ++digits;
            ++position;
        }
        if (digits == 0) {
            return std::nullopt;
        }
    }

    int offset_minutes = 0;
    if (position < text.size()) {
        const char designator = text[position];
        if (designator == 'Z') {
            ++position;
        } else if (designator == '+' || designator == '-') {
            ++position;
            int offset_hour = 0;
            int offset_minute = 0;
            if (!read_digits(text, position, 2, offset_hour) || !expect(text, position, ':')
                || !read_digits(text, position, 2, offset_minute)) {
                return std::nullopt;
            }
            offset_minutes = (offset_hour * 60 + offset_minute) * (designator == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }
    if (position != text.size()) {
        return std::nullopt;
    }

    std::tm calendar{};
    calendar.tm_year = year - 1900;
    calendar.tm_mon = month - 1;
    calendar.tm_mday = day;
    calendar.tm_hour = hour;
    calendar.tm_min = minute;
    calendar.tm_sec = second;
    const std::time_t epoch_seconds = timegm(&calendar);

    return WallClock::time_point{
        std::chrono::duration_cast<WallClock::duration>(
            std::chrono::seconds{epoch_seconds} - std::chrono::minutes{offset_minutes} + std::chrono::microseconds{microseconds}
        )
    };
}

std::string format_file_stamp(WallClock::time_point time_point) {
    const SplitTime split_time = split(time_point);
    const std::tm& tm = split_time.calendar;
    return fmt::format(
        "{:04d}{:02d}{:02d}_{:02d}{:02d}{:02d}_{:06d}",
        tm.tm_year + 1900,
        tm.tm_mon + 1,
        tm.tm_mday,
        tm.tm_hour,
        tm.tm_min,
        tm.tm_sec,
        split_time.microseconds
    );
}

}  // namespace drone_sentry
