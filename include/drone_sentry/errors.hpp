// === Errors ==================================================================
//
// Error taxonomy shared by every fallible operation in the mission core. Expected
// failures (bad credentials, lost links, rejected commands, broken audit chains)
// travel as values through `Result<T>` / `Status`; exceptions are reserved for
// programmer errors such as constructing a component without its collaborators.

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace drone_sentry {

/** @brief Failure categories reported across the mission core. */
enum class ErrorKind {
    NotProvisioned,
    AlreadyProvisioned,
    ConnectionFailure,
    CommandRejected,
    AckTimeout,
    ModeChangeUnconfirmed,
    InvalidSignature,
    TamperDetected,
    InvalidOperator,
    CommandExpired,
    PreflightFailure,
    StoreFailure,
    InvalidArgument,
    IoFailure,
    CryptoFailure,
    InvalidTimestamp
};

/** @brief Stable snake_case name used in logs, audit details and CLI output. */
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/** @brief Error value carried by failed results. */
struct Error final {
    ErrorKind kind{ErrorKind::InvalidArgument};
    std::string message{};              /**< Human-readable description. */
    std::vector<std::string> reasons{}; /**< Every failing condition (preflight). */
};

/**
 * @brief Value-or-error return type for fallible operations.
 */
template <typename T>
class [[nodiscard]] Result final {
  public:
    Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : storage_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept { return storage_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & { return std::get<0>(storage_); }
    [[nodiscard]] const T& value() const& { return std::get<0>(storage_); }
    // By value so a temporary Result cannot leave a dangling reference behind.
    [[nodiscard]] T value() && { return std::get<0>(std::move(storage_)); }

    [[nodiscard]] const Error& error() const& { return std::get<1>(storage_); }
    [[nodiscard]] ErrorKind kind() const { return error().kind; }

  private:
    std::variant<T, Error> storage_;
};

/**
 * @brief Success-or-error return type for operations without a payload.
 */
class [[nodiscard]] Status final {
  public:
    Status() = default;
    Status(Error error) : error_(std::move(error)), failed_(true) {}

    [[nodiscard]] static Status success() { return Status{}; }

    [[nodiscard]] bool ok() const noexcept { return !failed_; }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] const Error& error() const noexcept { return error_; }
    [[nodiscard]] ErrorKind kind() const noexcept { return error_.kind; }

  private:
    Error error_{};
    bool failed_{false};
};

/** @brief Shorthand for building an Error value. */
inline Error make_error(ErrorKind kind, std::string message, std::vector<std::string> reasons = {}) {
    return Error{kind, std::move(message), std::move(reasons)};
}

}  // namespace drone_sentry
