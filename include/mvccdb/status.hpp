#pragma once

/**
 * @file status.hpp
 * @brief Public status and error codes for mvccdb
 */

#include <string>
#include <string_view>

namespace mvccdb {

/**
 * @brief Status codes for engine operations
 */
enum class StatusCode {
    kOk = 0,
    kError,
    kNotFound,
    kAlreadyExists,
    kInvalidArgument,
    kCorruption,
    kNotSupported,
    kInternal,

    // Transaction errors
    kInvalidTransaction,
    kInvalidIsolation,
    kRecordNotFound,
    kDuplicateKey,
    kWriteConflict,
    kSerializationConflict,
};

/**
 * @brief Status class for operation results
 *
 * Status encapsulates the result of an operation. It can indicate success
 * or failure, and in case of failure, provides an error code and message.
 *
 * Only kSerializationConflict is ever returned together with a change of
 * transaction state (the transaction ends ABORTED). Every other error leaves
 * the transaction exactly as it was.
 */
class Status {
public:
    /**
     * @brief Create a success status
     */
    Status() noexcept : code_(StatusCode::kOk) {}

    /**
     * @brief Create a status with the given code
     */
    explicit Status(StatusCode code) noexcept : code_(code) {}

    /**
     * @brief Create a status with code and message
     */
    Status(StatusCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    // Factory methods for common statuses
    [[nodiscard]] static Status Ok() noexcept { return Status(); }
    [[nodiscard]] static Status Error(std::string msg = "") { return Status(StatusCode::kError, std::move(msg)); }
    [[nodiscard]] static Status NotFound(std::string msg = "") { return Status(StatusCode::kNotFound, std::move(msg)); }
    [[nodiscard]] static Status AlreadyExists(std::string msg = "") { return Status(StatusCode::kAlreadyExists, std::move(msg)); }
    [[nodiscard]] static Status InvalidArgument(std::string msg = "") { return Status(StatusCode::kInvalidArgument, std::move(msg)); }
    [[nodiscard]] static Status Corruption(std::string msg = "") { return Status(StatusCode::kCorruption, std::move(msg)); }
    [[nodiscard]] static Status NotSupported(std::string msg = "") { return Status(StatusCode::kNotSupported, std::move(msg)); }
    [[nodiscard]] static Status Internal(std::string msg = "") { return Status(StatusCode::kInternal, std::move(msg)); }

    [[nodiscard]] static Status InvalidTransaction(std::string msg = "") { return Status(StatusCode::kInvalidTransaction, std::move(msg)); }
    [[nodiscard]] static Status InvalidIsolation(std::string msg = "") { return Status(StatusCode::kInvalidIsolation, std::move(msg)); }
    [[nodiscard]] static Status RecordNotFound(std::string msg = "") { return Status(StatusCode::kRecordNotFound, std::move(msg)); }
    [[nodiscard]] static Status DuplicateKey(std::string msg = "") { return Status(StatusCode::kDuplicateKey, std::move(msg)); }
    [[nodiscard]] static Status WriteConflict(std::string msg = "") { return Status(StatusCode::kWriteConflict, std::move(msg)); }
    [[nodiscard]] static Status SerializationConflict(std::string msg = "") { return Status(StatusCode::kSerializationConflict, std::move(msg)); }

    // Query methods
    [[nodiscard]] bool ok() const noexcept { return code_ == StatusCode::kOk; }
    [[nodiscard]] bool is_error() const noexcept { return code_ != StatusCode::kOk; }
    [[nodiscard]] bool is_not_found() const noexcept { return code_ == StatusCode::kNotFound; }
    [[nodiscard]] bool is_invalid_transaction() const noexcept { return code_ == StatusCode::kInvalidTransaction; }
    [[nodiscard]] bool is_record_not_found() const noexcept { return code_ == StatusCode::kRecordNotFound; }
    [[nodiscard]] bool is_duplicate_key() const noexcept { return code_ == StatusCode::kDuplicateKey; }
    [[nodiscard]] bool is_serialization_conflict() const noexcept { return code_ == StatusCode::kSerializationConflict; }

    [[nodiscard]] StatusCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /**
     * @brief Get a human-readable string representation
     */
    [[nodiscard]] std::string to_string() const;

    // Implicit conversion to bool for convenience
    explicit operator bool() const noexcept { return ok(); }

private:
    StatusCode code_;
    std::string message_;
};

}  // namespace mvccdb
