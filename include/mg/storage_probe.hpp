/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file storage_probe.hpp
 * @brief Lightweight storage verification port and its SQLite backend.
 *
 * IoHealthMonitor only needs two yes/no answers from the persistence layer:
 * is the database intact, and can we still talk to it. Probes never throw;
 * each failure carries a short human-readable reason.
 */

#ifndef MG_STORAGE_PROBE_HPP_
#define MG_STORAGE_PROBE_HPP_

#include "mg/log.hpp"
#include "mg/vocabulary.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <cstring>

namespace mg {

enum class ProbeError : uint8_t {
  kOpenFailed = 0,
  kQueryFailed,
  kNoResult,
  kIntegrityFailed,
  kIoFailed,
  kMismatch,
};

inline const char* ProbeErrorName(ProbeError e) noexcept {
  switch (e) {
    case ProbeError::kOpenFailed:
      return "open failed";
    case ProbeError::kQueryFailed:
      return "query failed";
    case ProbeError::kNoResult:
      return "no result";
    case ProbeError::kIntegrityFailed:
      return "integrity check failed";
    case ProbeError::kIoFailed:
      return "I/O error";
    case ProbeError::kMismatch:
      return "read-back mismatch";
    default:
      return "unknown";
  }
}

using ProbeReason = FixedString<127>;

/// Probe failure: a code plus the backend's own message.
struct ProbeFailure {
  ProbeError code = ProbeError::kIoFailed;
  ProbeReason reason;
};

using ProbeResult = expected<void, ProbeFailure>;

inline ProbeResult ProbeFail(ProbeError code, const char* reason) noexcept {
  ProbeFailure f;
  f.code = code;
  f.reason.assign(TruncateToCapacity, reason != nullptr ? reason : ProbeErrorName(code));
  return ProbeResult::error(f);
}

// ============================================================================
// StorageProbe
// ============================================================================

class StorageProbe {
 public:
  virtual ~StorageProbe() = default;

  /// Structural integrity of the store.
  virtual ProbeResult CheckIntegrity() = 0;

  /// The store answers basic metadata queries.
  virtual ProbeResult CheckWritable() = 0;
};

// ============================================================================
// SqliteStorageProbe
// ============================================================================

/**
 * @brief StorageProbe over an SQLite database file.
 *
 * Opens the database read-write for each check (5 s busy timeout) so a
 * stale handle can never mask a broken file.
 */
class SqliteStorageProbe final : public StorageProbe {
 public:
  static constexpr int kBusyTimeoutMs = 5000;

  explicit SqliteStorageProbe(const char* db_path) noexcept
      : db_path_(TruncateToCapacity, db_path) {}

  ProbeResult CheckIntegrity() override {
    Db db;
    ProbeResult r = db.Open(db_path_.c_str());
    if (!r.has_value()) {
      return r;
    }
    ProbeReason first_row;
    r = db.FirstRow("PRAGMA quick_check", &first_row);
    if (!r.has_value()) {
      return r;
    }
    if (first_row != "ok") {
      MG_LOG_WARN("IoHealth", "quick_check on %s: %s", db_path_.c_str(), first_row.c_str());
      return ProbeFail(ProbeError::kIntegrityFailed, first_row.c_str());
    }
    return ProbeResult::success();
  }

  ProbeResult CheckWritable() override {
    Db db;
    ProbeResult r = db.Open(db_path_.c_str());
    if (!r.has_value()) {
      return r;
    }
    r = db.FirstRow("PRAGMA journal_mode", nullptr);
    if (!r.has_value()) {
      return r;
    }
    return db.FirstRow("PRAGMA page_count", nullptr);
  }

  const char* Path() const noexcept { return db_path_.c_str(); }

 private:
  /// Scoped sqlite3 connection.
  class Db {
   public:
    Db() noexcept = default;
    ~Db() {
      if (db_ != nullptr) {
        sqlite3_close(db_);
      }
    }
    Db(const Db&) = delete;
    Db& operator=(const Db&) = delete;

    ProbeResult Open(const char* path) noexcept {
      int rc = sqlite3_open_v2(path, &db_, SQLITE_OPEN_READWRITE, nullptr);
      if (rc != SQLITE_OK) {
        return ProbeFail(ProbeError::kOpenFailed,
                         db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
      }
      (void)sqlite3_busy_timeout(db_, kBusyTimeoutMs);
      return ProbeResult::success();
    }

    /// Run @p sql; fail unless it yields at least one row.
    ProbeResult FirstRow(const char* sql, ProbeReason* text) noexcept {
      sqlite3_stmt* stmt = nullptr;
      if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return ProbeFail(ProbeError::kQueryFailed, sqlite3_errmsg(db_));
      }
      int rc = sqlite3_step(stmt);
      ProbeResult result = ProbeResult::success();
      if (rc == SQLITE_ROW) {
        if (text != nullptr) {
          const unsigned char* col = sqlite3_column_text(stmt, 0);
          text->assign(TruncateToCapacity,
                       col != nullptr ? reinterpret_cast<const char*>(col) : "");
        }
      } else if (rc == SQLITE_DONE) {
        result = ProbeFail(ProbeError::kNoResult, sql);
      } else {
        result = ProbeFail(ProbeError::kQueryFailed, sqlite3_errmsg(db_));
      }
      sqlite3_finalize(stmt);
      return result;
    }

   private:
    sqlite3* db_ = nullptr;
  };

  FixedString<255> db_path_;
};

}  // namespace mg

#endif  // MG_STORAGE_PROBE_HPP_
