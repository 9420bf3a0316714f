#include "drone_sentry/id_generator.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace drone_sentry {

namespace {

constexpr std::uint64_t k_timestamp_mask{0xFFFF'FFFF'FFFFULL};  /**< 48 bits of Unix milliseconds. */
constexpr std::uint64_t k_counter_max{0xFFFULL};                /**< 12-bit rand_a counter. */
constexpr std::uint64_t k_random_mask{0x3FFF'FFFF'FFFF'FFFFULL}; /**< 62 bits of rand_b. */

std::uint64_t system_epoch_ms() {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count()
    );
}

}  // namespace

IdGenerator::IdGenerator() : IdGenerator(system_epoch_ms) {}

IdGenerator::IdGenerator(MillisecondClock clock)
    : clock_(std::move(clock)),
      random_engine_(std::random_device{}()) {
    if (!clock_) {
        throw std::invalid_argument("IdGenerator requires a clock");
    }
}

std::string IdGenerator::next() {
    std::scoped_lock lock(mutex_);

    std::uint64_t timestamp_ms = clock_() & k_timestamp_mask;
    if (timestamp_ms <= last_timestamp_ms_) {
        // Same millisecond (or a clock step backwards): stay on the last timestamp and count.
        timestamp_ms = last_timestamp_ms_;
        ++counter_;
        if (counter_ > k_counter_max) {
            ++timestamp_ms;
            counter_ = 0;
        }
    } else {
        counter_ = 0;
    }
    last_timestamp_ms_ = timestamp_ms;

    const std::uint64_t high = (timestamp_ms << 16) | (0x7ULL << 12) | counter_;
    const std::uint64_t low = (0x2ULL << 62) | (random_engine_() & k_random_mask);

    return fmt::format(
        "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<std::uint32_t>(high >> 32),
        static_cast<std::uint32_t>((high >> 16) & 0xFFFF),
        static_cast<std::uint32_t>(high & 0xFFFF),
        static_cast<std::uint32_t>(low >> 48),
        low & 0xFFFF'FFFF'FFFFULL
    );
}

}  // namespace drone_sentry
