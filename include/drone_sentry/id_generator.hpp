// === Id Generator ============================================================
//
// Produces time-sortable UUIDv7 identifiers for missions, findings, audit
// entries and operators. Each generator owns its last-millisecond/counter state
// behind a lock; components receive the instance they should use instead of
// reaching for process-wide state.

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>

namespace drone_sentry {

/** @brief Thread-safe UUIDv7 generator with a monotonic per-millisecond counter. */
class IdGenerator final {
  public:
    /** @brief Source of Unix epoch milliseconds; injectable for tests. */
    using MillisecondClock = std::function<std::uint64_t()>;

    IdGenerator();
    explicit IdGenerator(MillisecondClock clock);

    IdGenerator(const IdGenerator&) = delete;
    IdGenerator& operator=(const IdGenerator&) = delete;

    /**
     * @brief Generate the next identifier.
     *
     * Identifiers generated by one instance sort strictly increasing as strings:
     * the 48-bit timestamp never moves backwards and a 12-bit counter orders
     * identifiers minted within the same millisecond.
     */
    [[nodiscard]] std::string next();

  private:
    MillisecondClock clock_;
    std::mutex mutex_;
    std::mt19937_64 random_engine_;
    std::uint64_t last_timestamp_ms_{0};
    std::uint64_t counter_{0};
};

}  // namespace drone_sentry
