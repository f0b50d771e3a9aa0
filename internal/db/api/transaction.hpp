#pragma once

namespace taskpilot::db {

/*
  Unit of work over a Repository. Every TaskStore call opens exactly one.

  - Writes stay invisible to other transactions until Commit()
  - Rollback() discards every write
  - Destroying an uncommitted transaction rolls it back

  SQLite: BEGIN IMMEDIATE
  Memory: private working copy swapped in on commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
