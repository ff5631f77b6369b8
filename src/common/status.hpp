#pragma once

/**
 * @file status.hpp
 * @brief Internal status implementation
 *
 * This file re-exports the public status.hpp and adds internal utilities.
 */

#include "mvccdb/status.hpp"

namespace mvccdb {

/**
 * @brief Macro to return early if status is not OK
 */
#define MVCCDB_RETURN_IF_ERROR(expr)    \
    do {                                \
        auto _status = (expr);          \
        if (!_status.ok()) {            \
            return _status;             \
        }                               \
    } while (false)

/**
 * @brief Macro to return a Result carrying the status if it is not OK
 */
#define MVCCDB_RETURN_RESULT_IF_ERROR(expr) \
    do {                                    \
        auto _status = (expr);              \
        if (!_status.ok()) {                \
            return Result(_status);         \
        }                                   \
    } while (false)

}  // namespace mvccdb
