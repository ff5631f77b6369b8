/**
 * @file types.cpp
 * @brief Isolation level name parsing
 */

#include "common/types.hpp"

#include <cctype>

namespace mvccdb {

Status parse_isolation_level(std::string_view name, IsolationLevel *out) {
  std::string normalized;
  normalized.reserve(name.size());
  for (char c : name) {
    if (c == ' ' || c == '-') {
      c = '_';
    }
    normalized.push_back(
        static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }

  for (IsolationLevel level :
       {IsolationLevel::READ_UNCOMMITTED, IsolationLevel::READ_COMMITTED,
        IsolationLevel::REPEATABLE_READ, IsolationLevel::SERIALIZABLE}) {
    if (normalized == isolation_level_to_string(level)) {
      *out = level;
      return Status::Ok();
    }
  }
  return Status::InvalidIsolation("Unknown isolation level: " +
                                  std::string(name));
}

}  // namespace mvccdb
