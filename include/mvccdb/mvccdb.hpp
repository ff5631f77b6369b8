#pragma once

/**
 * @file mvccdb.hpp
 * @brief Main include header for mvccdb
 *
 * Include this single header to access the public API of mvccdb.
 */

#include "mvccdb/database.hpp"
#include "mvccdb/engine_state.hpp"
#include "mvccdb/predicate.hpp"
#include "mvccdb/result.hpp"
#include "mvccdb/status.hpp"
#include "mvccdb/transaction_info.hpp"
#include "mvccdb/types.hpp"

namespace mvccdb {

/**
 * @brief Get the version string of mvccdb
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* version() noexcept {
    return "0.1.0";
}

/**
 * @brief Get the major version number
 */
constexpr int version_major() noexcept {
    return 0;
}

/**
 * @brief Get the minor version number
 */
constexpr int version_minor() noexcept {
    return 1;
}

/**
 * @brief Get the patch version number
 */
constexpr int version_patch() noexcept {
    return 0;
}

}  // namespace mvccdb
