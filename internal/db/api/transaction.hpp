#pragma once

namespace mirrorguard::db {

/*
  Unit of work against the relational mirror.

  A synchronization pass for one entity type, or the post stamping
  after a revert, runs inside one Transaction: either all rows land
  or none do. A Transaction destroyed before Commit() rolls back.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsFinished() const = 0;
};

} // namespace mirrorguard::db
