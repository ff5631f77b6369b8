/**
 * @file status.cpp
 * @brief Status class implementation
 */

#include "mvccdb/status.hpp"

namespace mvccdb {

std::string Status::to_string() const {
    std::string result;

    switch (code_) {
        case StatusCode::kOk:                    result = "OK"; break;
        case StatusCode::kError:                 result = "Error"; break;
        case StatusCode::kNotFound:              result = "NotFound"; break;
        case StatusCode::kAlreadyExists:         result = "AlreadyExists"; break;
        case StatusCode::kInvalidArgument:       result = "InvalidArgument"; break;
        case StatusCode::kCorruption:            result = "Corruption"; break;
        case StatusCode::kNotSupported:          result = "NotSupported"; break;
        case StatusCode::kInternal:              result = "Internal"; break;
        case StatusCode::kInvalidTransaction:    result = "InvalidTransaction"; break;
        case StatusCode::kInvalidIsolation:      result = "InvalidIsolation"; break;
        case StatusCode::kRecordNotFound:        result = "RecordNotFound"; break;
        case StatusCode::kDuplicateKey:          result = "DuplicateKey"; break;
        case StatusCode::kWriteConflict:         result = "WriteConflict"; break;
        case StatusCode::kSerializationConflict: result = "SerializationConflict"; break;
    }

    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }

    return result;
}

}  // namespace mvccdb
