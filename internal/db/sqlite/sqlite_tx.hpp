#pragma once

#include <memory>

#include "internal/db/api/session.hpp"
#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace systock::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - a batch never upgrades from a read lock mid-way
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteDB& DB() const { return *db_; }
  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool finished_ = false;
};

class SqliteSession final : public db::Session {
public:
  explicit SqliteSession(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

  std::unique_ptr<Transaction> Begin() override {
    return std::make_unique<SqliteTransaction>(db_);
  }

private:
  std::shared_ptr<SqliteDB> db_;
};

}
