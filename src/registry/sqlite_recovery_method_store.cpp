#include "mpcrec/registry/recovery_method_store.hpp"

#include <mutex>
#include <stdexcept>
#include <string>

#include <sqlite3.h>

#include "mpcrec/common/bytes.hpp"

namespace mpcrec {
namespace {

namespace sql {

constexpr char kCreateTables[] = R"(
    CREATE TABLE IF NOT EXISTS recovery_methods (
        account_id TEXT NOT NULL,
        provider TEXT NOT NULL,
        subject TEXT NOT NULL,
        public_key BLOB NOT NULL,
        created_at INTEGER NOT NULL,
        PRIMARY KEY (account_id, provider, subject)
    );
)";

constexpr char kInsertIfAbsent[] = R"(
    INSERT INTO recovery_methods (account_id, provider, subject, public_key, created_at)
    VALUES (?, ?, ?, ?, ?)
    ON CONFLICT (account_id, provider, subject) DO NOTHING;
)";

constexpr char kSelect[] = R"(
    SELECT public_key, created_at FROM recovery_methods
    WHERE account_id = ? AND provider = ? AND subject = ?;
)";

constexpr char kDelete[] = R"(
    DELETE FROM recovery_methods
    WHERE account_id = ? AND provider = ? AND subject = ?;
)";

}  // namespace sql

// Finalizes the prepared statement on every exit path.
class Statement {
 public:
  Statement(sqlite3* db, const char* query) : db_(db) {
    if (sqlite3_prepare_v2(db_, query, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }
  }

  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int index, std::string_view value) {
    Check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                            SQLITE_TRANSIENT));
  }

  void BindBlob(int index, const Bytes& value) {
    Check(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()),
                            SQLITE_TRANSIENT));
  }

  void BindInt64(int index, int64_t value) { Check(sqlite3_bind_int64(stmt_, index, value)); }

  void BindKey(std::string_view account_id, const Identity& identity) {
    BindText(1, account_id);
    BindText(2, identity.provider);
    BindText(3, identity.subject);
  }

  // True while a row is available.
  bool Step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
  }

  Bytes ColumnBlob(int column) const {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, column));
    const int len = sqlite3_column_bytes(stmt_, column);
    if (data == nullptr || len <= 0) {
      return {};
    }
    return Bytes(data, data + len);
  }

  int64_t ColumnInt64(int column) const { return sqlite3_column_int64(stmt_, column); }

 private:
  void Check(int rc) {
    if (rc != SQLITE_OK) {
      throw std::runtime_error(std::string("SQLite bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  sqlite3* db_;
  sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace

class SqliteRecoveryMethodStore::Impl {
 public:
  explicit Impl(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
      const std::string error = db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory";
      sqlite3_close(db_);
      throw std::runtime_error("Failed to open recovery method database: " + error);
    }
    Exec(sql::kCreateTables);
  }

  ~Impl() {
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
  }

  std::optional<RecoveryMethod> Lookup(std::string_view account_id, const Identity& identity) {
    std::lock_guard<std::mutex> lock(mu_);
    return SelectLocked(account_id, identity);
  }

  RecoveryMethod InsertIfAbsent(const RecoveryMethod& method, bool* inserted) {
    std::lock_guard<std::mutex> lock(mu_);
    Exec("BEGIN IMMEDIATE;");
    try {
      Statement insert(db_, sql::kInsertIfAbsent);
      insert.BindKey(method.account_id, method.identity);
      insert.BindBlob(4, method.public_key.ToCompressedBytes());
      insert.BindInt64(5, static_cast<int64_t>(method.created_at));
      insert.Step();
      const bool fresh = sqlite3_changes(db_) == 1;

      std::optional<RecoveryMethod> stored = SelectLocked(method.account_id, method.identity);
      if (!stored.has_value()) {
        throw std::runtime_error("recovery method row missing after insert");
      }
      Exec("COMMIT;");
      if (inserted != nullptr) {
        *inserted = fresh;
      }
      return *stored;
    } catch (const std::exception&) {
      sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
      throw;
    }
  }

  bool Remove(std::string_view account_id, const Identity& identity) {
    std::lock_guard<std::mutex> lock(mu_);
    Statement remove(db_, sql::kDelete);
    remove.BindKey(account_id, identity);
    remove.Step();
    return sqlite3_changes(db_) > 0;
  }

 private:
  std::optional<RecoveryMethod> SelectLocked(std::string_view account_id, const Identity& identity) {
    Statement select(db_, sql::kSelect);
    select.BindKey(account_id, identity);
    if (!select.Step()) {
      return std::nullopt;
    }

    RecoveryMethod out;
    out.account_id = std::string(account_id);
    out.identity = identity;
    out.public_key = ECPoint::FromCompressed(select.ColumnBlob(0));
    out.created_at = static_cast<uint64_t>(select.ColumnInt64(1));
    return out;
  }

  void Exec(const char* statement) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db_, statement, nullptr, nullptr, &err_msg) != SQLITE_OK) {
      const std::string error = err_msg != nullptr ? err_msg : "unknown error";
      sqlite3_free(err_msg);
      throw std::runtime_error("SQLite exec failed: " + error);
    }
  }

  sqlite3* db_ = nullptr;
  std::mutex mu_;
};

SqliteRecoveryMethodStore::SqliteRecoveryMethodStore(const std::string& db_path)
    : impl_(std::make_unique<Impl>(db_path)) {}

SqliteRecoveryMethodStore::~SqliteRecoveryMethodStore() = default;

std::optional<RecoveryMethod> SqliteRecoveryMethodStore::Lookup(std::string_view account_id,
                                                                const Identity& identity) {
  return impl_->Lookup(account_id, identity);
}

RecoveryMethod SqliteRecoveryMethodStore::InsertIfAbsent(const RecoveryMethod& method,
                                                         bool* inserted) {
  return impl_->InsertIfAbsent(method, inserted);
}

bool SqliteRecoveryMethodStore::Remove(std::string_view account_id, const Identity& identity) {
  return impl_->Remove(account_id, identity);
}

}  // namespace mpcrec
