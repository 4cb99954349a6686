#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace vaultsync {

/**
 * ErrorKind - Coarse classification used by the sync engine to decide
 * whether a failure is retried, surfaced, or propagated.
 */
enum class ErrorKind {
    Generic,
    Storage,              // Store I/O failure. Always propagated.
    ProviderUnavailable,  // Vault not reachable right now. Always retried.
    ProviderWrite,        // Saving to the vault failed. Retried up to the limit.
    ProviderRead,         // Loading from the vault failed. Retried up to the limit.
    NotFound,
    InvalidArgument,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Generic: return "generic";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::ProviderUnavailable: return "provider_unavailable";
        case ErrorKind::ProviderWrite: return "provider_write";
        case ErrorKind::ProviderRead: return "provider_read";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "generic";
}

/**
 * Error type for Result - a message, an optional numeric code (the SQLite
 * result code for storage failures) and a kind.
 */
struct Error {
    std::string message;
    int code{0};
    ErrorKind kind{ErrorKind::Generic};

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    Error(ErrorKind k, std::string msg, int c = 0)
        : message(std::move(msg)), code(c), kind(k) {}

    /**
     * Provider failures are worth another attempt later; everything else is not.
     */
    [[nodiscard]] bool is_retryable() const noexcept {
        return kind == ErrorKind::ProviderUnavailable ||
               kind == ErrorKind::ProviderWrite ||
               kind == ErrorKind::ProviderRead;
    }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code && kind == other.kind;
    }
};

[[nodiscard]] inline Error storage_error(std::string message, int code = 0) {
    return Error{ErrorKind::Storage, std::move(message), code};
}

/**
 * Result<T, E> - Either a value (ok) or an error (err).
 *
 *   Result<SyncState> load(const Uuid& id);
 *   auto status = load(id).map([](const SyncState& s) { return s.status; });
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the value, throwing std::runtime_error if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    /**
     * Run a side effect (usually logging) on the error, returning this Result.
     */
    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (!is_err()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based access so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success carries no value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    void unwrap() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), error_);
        }
        return *this;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace vaultsync
