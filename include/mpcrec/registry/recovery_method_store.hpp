#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "mpcrec/crypto/ec_point.hpp"
#include "mpcrec/protocol/types.hpp"

namespace mpcrec {

struct RecoveryMethod {
  std::string account_id;
  Identity identity;
  ECPoint public_key;
  uint64_t created_at = 0;  // unix seconds
};

class IRecoveryMethodStore {
 public:
  virtual ~IRecoveryMethodStore() = default;

  virtual std::optional<RecoveryMethod> Lookup(std::string_view account_id,
                                               const Identity& identity) = 0;

  // Inserts the row unless one already exists for (account, identity), in a
  // single atomic step. Returns the row stored afterwards; *inserted tells
  // whether it is the caller's.
  virtual RecoveryMethod InsertIfAbsent(const RecoveryMethod& method, bool* inserted) = 0;

  virtual bool Remove(std::string_view account_id, const Identity& identity) = 0;
};

// One database per node. ":memory:" gives a private in-memory database.
class SqliteRecoveryMethodStore final : public IRecoveryMethodStore {
 public:
  explicit SqliteRecoveryMethodStore(const std::string& db_path);
  ~SqliteRecoveryMethodStore() override;

  SqliteRecoveryMethodStore(const SqliteRecoveryMethodStore&) = delete;
  SqliteRecoveryMethodStore& operator=(const SqliteRecoveryMethodStore&) = delete;

  std::optional<RecoveryMethod> Lookup(std::string_view account_id,
                                       const Identity& identity) override;
  RecoveryMethod InsertIfAbsent(const RecoveryMethod& method, bool* inserted) override;
  bool Remove(std::string_view account_id, const Identity& identity) override;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace mpcrec
