#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace courier::db::sqlite {

/*
  Owns the sqlite3 connection behind the bundle store.

  Opened in serialized mode with extended result codes, foreign keys on and
  synchronous=FULL: a stored bundle survives a crash after its receipt was
  sent. SQLITE_CORRUPT and SQLITE_NOTADB surface as util::Corruption so the
  node can fail the store instead of serving from a damaged file.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  // First column of the first row, for pragmas and counts.
  int64_t QueryInt(const std::string& sql);

  // PRAGMA quick_check; throws util::Corruption on anything but "ok".
  void VerifyIntegrity();

 private:
  void Configure(bool wal_mode);
  void Check(int rc, const std::string& what) const;

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace courier::db::sqlite
