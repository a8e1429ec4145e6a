#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <chrono>
#include <ctime>
#include <stdexcept>
#include <string>

namespace rag_core {

// BUSY and LOCKED clear on their own once the competing writer commits.
inline bool is_transient_sqlite_error(int code) {
  const int primary = code & 0xff;
  return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

// "<operation> failed: <sqlite description> (<message>) [code/xcode, sql]"
inline std::string format_db_error(const std::string& operation,
                                   const sqlite::sqlite_exception& e) {
  std::string msg = operation + " failed: " + sqlite3_errstr(e.get_extended_code());
  if (is_transient_sqlite_error(e.get_code())) {
    msg += ", retry later";
  }
  msg += " (" + std::string(e.what()) + ") [code " + std::to_string(e.get_code()) + "/" +
         std::to_string(e.get_extended_code());
  if (!e.get_sql().empty()) {
    msg += ", sql: " + e.get_sql();
  }
  return msg + "]";
}

constexpr const char* kSqlTimestampFormat = "%Y-%m-%d %H:%M:%S";

// Rows store UTC timestamps as "YYYY-MM-DD HH:MM:SS".
inline std::string time_point_to_string(const std::chrono::system_clock::time_point& tp) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buffer[32];
  const size_t written = std::strftime(buffer, sizeof(buffer), kSqlTimestampFormat, &utc);
  return std::string(buffer, written);
}

inline std::chrono::system_clock::time_point string_to_time_point(const std::string& text) {
  std::tm utc{};
  const char* end = strptime(text.c_str(), kSqlTimestampFormat, &utc);
  if (end == nullptr || *end != '\0') {
    throw std::runtime_error("Unparseable timestamp '" + text +
                             "', expected YYYY-MM-DD HH:MM:SS");
  }
  return std::chrono::system_clock::from_time_t(timegm(&utc));
}

}  // namespace rag_core
