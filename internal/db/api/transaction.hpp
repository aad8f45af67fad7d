#pragma once

namespace imgvar::db {

/*
  Unit of work for ImageRepository calls.

  Every backend guarantees:
    - an inserted image is visible to later calls on the same transaction
      and to other transactions only after Commit()
    - a transaction that is destroyed without Commit() leaves no rows
    - Commit()/Rollback() are terminal; the object is not reused

  Backends: BEGIN IMMEDIATE (sqlite), pqxx::work (postgres),
  snapshot plus replayed write log (memory).
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // Throws on backend failure; nothing is written in that case.
  virtual void Commit() = 0;

  virtual void Rollback() = 0;
};

} // namespace imgvar::db
