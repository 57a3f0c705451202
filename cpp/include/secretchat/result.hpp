/**
 * @file result.hpp
 * @brief Typed operation results and the secret-messaging error taxonomy
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every fallible secretchat operation returns Result<T>: either a value or a
 * SecretError with a diagnostic message. Callers decide user-facing messaging.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace secretchat {

/**
 * @brief Failure kinds reported by the secret conversation core
 */
enum class SecretError {
    ENTROPY_UNAVAILABLE,        ///< No secure randomness; fatal for key generation
    STORAGE_UNAVAILABLE,        ///< Key storage cannot be read or written
    INVALID_PEER_KEY,           ///< Peer public key is malformed or not a usable curve point
    DECRYPTION_FAILED,          ///< Authentication tag mismatch or malformed payload
    INVALID_KEY_LENGTH,         ///< Symmetric key is not exactly 32 bytes
    MESSAGE_TOO_LARGE,          ///< Plaintext exceeds MAX_MESSAGE_SIZE
    CONSENT_PENDING,            ///< Peer has not accepted yet (no peer public key)
    LOCAL_KEY_MISSING,          ///< No local key pair stored for the conversation
    INVALID_CONVERSATION,       ///< Request violates conversation shape rules
    CONVERSATION_NOT_FOUND,     ///< Unknown conversation identifier
    NOT_SECRET_CONVERSATION,    ///< Operation requires a private secret conversation
    NOT_A_MEMBER,               ///< Caller is not a member of the conversation
    PUBLIC_KEY_CONFLICT,        ///< Member record already carries a different key
    INVALID_IDENTIFIER          ///< Conversation or user id failed validation
};

/**
 * @brief Convert SecretError to a stable string ("StorageUnavailable", ...)
 */
const char* to_string(SecretError error);

/**
 * @brief Empty value for operations that only succeed or fail
 */
struct Unit {
    bool operator==(const Unit&) const { return true; }
    bool operator!=(const Unit&) const { return false; }
};

/**
 * @brief Error half of a Result, convertible to any Result<T>
 */
struct Failure {
    SecretError error;
    std::string message;
};

/**
 * @brief Value-or-error return type
 *
 * A failed Result converts to a Result of any other value type through
 * failure(), which keeps propagation at call sites to a single line:
 * @code
 *   auto keys = store.get(id);
 *   if (!keys) return keys.failure();
 * @endcode
 */
template <typename T>
class [[nodiscard]] Result {
public:
    Result(Failure failure) : state_(std::move(failure)) {}

    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result fail(SecretError error, std::string message = "") {
        return Result(std::in_place_index<1>, Failure{error, std::move(message)});
    }

    bool is_ok() const { return state_.index() == 0; }
    explicit operator bool() const { return is_ok(); }

    T& value() & {
        require_value();
        return std::get<0>(state_);
    }

    const T& value() const& {
        require_value();
        return std::get<0>(state_);
    }

    T&& value() && {
        require_value();
        return std::get<0>(std::move(state_));
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(state_) : std::move(fallback);
    }

    SecretError error() const { return failure_ref().error; }
    const std::string& message() const { return failure_ref().message; }
    Failure failure() const { return failure_ref(); }

private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> index, Args&&... args)
        : state_(index, std::forward<Args>(args)...) {}

    void require_value() const {
        if (state_.index() != 0) {
            throw std::logic_error(std::string("Result holds error: ") +
                                   to_string(std::get<1>(state_).error));
        }
    }

    const Failure& failure_ref() const {
        if (state_.index() != 1) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<1>(state_);
    }

    std::variant<T, Failure> state_;
};

} // namespace secretchat
