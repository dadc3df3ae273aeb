#include "store/sqlite_reading_store.h"

#include "common/errors.h"
#include "common/path_utils.h"
#include "common/time_utils.h"

#include <sqlite3.h>

#include <string>
#include <vector>

namespace store {
namespace {

const char* kSchemaSql =
    "CREATE TABLE IF NOT EXISTS antenna ("
    "  antenna_id TEXT PRIMARY KEY,"
    "  x          REAL NOT NULL,"
    "  y          REAL NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS tag ("
    "  tag_id  TEXT PRIMARY KEY,"
    "  type    TEXT NOT NULL CHECK(type IN ('ref','tar')),"
    "  true_x  REAL,"
    "  true_y  REAL,"
    "  pred_x  REAL,"
    "  pred_y  REAL,"
    "  is_read INTEGER NOT NULL DEFAULT 0,"
    "  CHECK ((type='ref' AND pred_x IS NULL AND pred_y IS NULL) OR (type='tar'))"
    ");"
    "CREATE TABLE IF NOT EXISTS record ("
    "  record_id  INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  tag_id     TEXT NOT NULL,"
    "  antenna_id TEXT NOT NULL,"
    "  rc         INTEGER NOT NULL CHECK(rc >= 0),"
    "  rssi       REAL NOT NULL,"
    "  read_time  TEXT NOT NULL,"
    "  FOREIGN KEY (tag_id)     REFERENCES tag(tag_id) ON DELETE CASCADE ON UPDATE CASCADE,"
    "  FOREIGN KEY (antenna_id) REFERENCES antenna(antenna_id) ON DELETE RESTRICT ON UPDATE CASCADE"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_record_tag     ON record(tag_id);"
    "CREATE INDEX IF NOT EXISTS idx_record_antenna ON record(antenna_id);";

const char* kTagColumns = "SELECT tag_id, type, true_x, true_y, pred_x, pred_y, is_read FROM tag";
const char* kReadingColumns = "SELECT record_id, tag_id, antenna_id, rc, rssi, read_time FROM record";

void exec_or_throw(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite3_exec failed";
    if (err) sqlite3_free(err);
    throw rfpos::StoreError(msg + " (sql=" + sql + ")");
  }
}

// Owns one prepared statement for the duration of a call.
class Stmt {
public:
  Stmt(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
      throw rfpos::StoreError(std::string("sqlite3_prepare_v2 failed: ") + sqlite3_errmsg(db) +
                              " (sql=" + sql + ")");
    }
  }
  ~Stmt() {
    if (stmt_) sqlite3_finalize(stmt_);
  }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  void BindText(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
  }
  void BindDouble(int idx, double v) { sqlite3_bind_double(stmt_, idx, v); }
  void BindInt64(int idx, std::int64_t v) { sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v)); }
  void BindOptDouble(int idx, const rfpos::OptDouble& v) {
    if (v) {
      sqlite3_bind_double(stmt_, idx, *v);
    } else {
      sqlite3_bind_null(stmt_, idx);
    }
  }

  // True while a row is available.
  bool StepRow() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw rfpos::StoreError(std::string("sqlite3_step failed: ") + sqlite3_errmsg(db_));
  }

  void StepDone() {
    const int rc = sqlite3_step(stmt_);
    if (rc != SQLITE_DONE) {
      throw rfpos::StoreError(std::string("sqlite3_step failed: ") + sqlite3_errmsg(db_));
    }
  }

  void Reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  std::string ColumnText(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_, col);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
  }
  double ColumnDouble(int col) const { return sqlite3_column_double(stmt_, col); }
  std::int64_t ColumnInt64(int col) const { return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col)); }
  rfpos::OptDouble ColumnOptDouble(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(stmt_, col);
  }

private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

Tag read_tag_row(const Stmt& st) {
  Tag t;
  t.tag_id  = st.ColumnText(0);
  t.role    = TagRoleFromText(st.ColumnText(1));
  t.true_x  = st.ColumnOptDouble(2);
  t.true_y  = st.ColumnOptDouble(3);
  t.pred_x  = st.ColumnOptDouble(4);
  t.pred_y  = st.ColumnOptDouble(5);
  t.is_read = st.ColumnInt64(6) != 0;
  return t;
}

Reading read_reading_row(const Stmt& st) {
  Reading r;
  r.record_id  = st.ColumnInt64(0);
  r.tag_id     = st.ColumnText(1);
  r.antenna_id = st.ColumnText(2);
  r.read_count = static_cast<int>(st.ColumnInt64(3));
  r.rssi       = st.ColumnDouble(4);
  r.timestamp  = rfpos::ParseTimestamp(st.ColumnText(5));
  return r;
}

bool is_memory_uri(const std::string& uri) {
  return uri.empty() || uri == ":memory:";
}

} // namespace

struct SqliteReadingStore::Impl {
  sqlite3* db = nullptr;
  bool in_txn = false;

  std::vector<Reading> QueryReadings(const std::string& where, const std::string& arg) const {
    std::string sql = kReadingColumns;
    if (!where.empty()) sql += " WHERE " + where;
    sql += " ORDER BY record_id;";
    Stmt st(db, sql);
    if (!where.empty()) st.BindText(1, arg);
    std::vector<Reading> out;
    while (st.StepRow()) {
      out.push_back(read_reading_row(st));
    }
    return out;
  }
};

SqliteReadingStore::SqliteReadingStore(const ReadingStoreConfig& cfg) : p_(new Impl()) {
  const std::string& uri = cfg.sqlite_db_uri;
  if (!is_memory_uri(uri) && !rfpos::pathu::EnsureParentDirectory(uri)) {
    delete p_;
    throw rfpos::StoreError("Cannot create directory for database '" + uri + "'");
  }

  const int rc = sqlite3_open(is_memory_uri(uri) ? ":memory:" : uri.c_str(), &p_->db);
  if (rc != SQLITE_OK) {
    const std::string msg = p_->db ? sqlite3_errmsg(p_->db) : "unknown";
    if (p_->db) sqlite3_close(p_->db);
    delete p_;
    throw rfpos::StoreError("sqlite3_open failed: " + msg);
  }

  try {
    exec_or_throw(p_->db, "PRAGMA foreign_keys=ON;");
    if (is_memory_uri(uri)) {
      exec_or_throw(p_->db, "PRAGMA temp_store=MEMORY;");
      exec_or_throw(p_->db, "PRAGMA journal_mode=MEMORY;");
    } else {
      exec_or_throw(p_->db, "PRAGMA journal_mode=" + (cfg.journal_mode.empty() ? std::string("WAL") : cfg.journal_mode) + ";");
      exec_or_throw(p_->db, "PRAGMA synchronous=" + (cfg.synchronous.empty() ? std::string("NORMAL") : cfg.synchronous) + ";");
    }
    exec_or_throw(p_->db, kSchemaSql);
  } catch (...) {
    sqlite3_close(p_->db);
    delete p_;
    throw;
  }
}

SqliteReadingStore::~SqliteReadingStore() {
  if (!p_) return;
  if (p_->db) sqlite3_close(p_->db);
  delete p_;
  p_ = nullptr;
}

void SqliteReadingStore::Begin() {
  exec_or_throw(p_->db, "BEGIN IMMEDIATE;");
  p_->in_txn = true;
}

void SqliteReadingStore::Commit() {
  exec_or_throw(p_->db, "COMMIT;");
  p_->in_txn = false;
}

void SqliteReadingStore::Rollback() {
  if (!p_->in_txn) return;
  // Errors here are not actionable; the transaction is abandoned either way.
  sqlite3_exec(p_->db, "ROLLBACK;", nullptr, nullptr, nullptr);
  p_->in_txn = false;
}

void SqliteReadingStore::BeginWrite() {
  if (p_->in_txn) {
    throw rfpos::StoreError("BeginWrite: a write batch is already open");
  }
  Begin();
}

void SqliteReadingStore::CommitWrite() {
  if (!p_->in_txn) {
    throw rfpos::StoreError("CommitWrite: no write batch is open");
  }
  Commit();
}

void SqliteReadingStore::RollbackWrite() {
  Rollback();
}

std::vector<Antenna> SqliteReadingStore::ListAntennas() const {
  Stmt st(p_->db, "SELECT antenna_id, x, y FROM antenna ORDER BY antenna_id;");
  std::vector<Antenna> out;
  while (st.StepRow()) {
    Antenna a;
    a.antenna_id = st.ColumnText(0);
    a.x = st.ColumnDouble(1);
    a.y = st.ColumnDouble(2);
    out.push_back(a);
  }
  return out;
}

std::vector<Tag> SqliteReadingStore::ListTags(std::optional<TagRole> role) const {
  std::string sql = kTagColumns;
  if (role) sql += " WHERE type = ?1";
  sql += " ORDER BY tag_id;";
  Stmt st(p_->db, sql);
  if (role) st.BindText(1, TagRoleToText(*role));
  std::vector<Tag> out;
  while (st.StepRow()) {
    out.push_back(read_tag_row(st));
  }
  return out;
}

std::optional<Tag> SqliteReadingStore::GetTag(const rfpos::TagId& tag_id) const {
  Stmt st(p_->db, std::string(kTagColumns) + " WHERE tag_id = ?1;");
  st.BindText(1, tag_id);
  if (!st.StepRow()) return std::nullopt;
  return read_tag_row(st);
}

std::vector<Reading> SqliteReadingStore::ListReadings() const {
  return p_->QueryReadings("", "");
}

std::vector<Reading> SqliteReadingStore::ListReadingsByTag(const rfpos::TagId& tag_id) const {
  return p_->QueryReadings("tag_id = ?1", tag_id);
}

std::vector<Reading> SqliteReadingStore::ListReadingsByAntenna(const rfpos::AntennaId& antenna_id) const {
  return p_->QueryReadings("antenna_id = ?1", antenna_id);
}

void SqliteReadingStore::UpsertAntenna(const Antenna& antenna) {
  if (antenna.antenna_id.empty()) {
    throw rfpos::DataError("Antenna id must not be empty");
  }
  // Not REPLACE: that deletes the row and trips the RESTRICT key from record.
  Stmt st(p_->db,
          "INSERT INTO antenna (antenna_id, x, y) VALUES (?1, ?2, ?3) "
          "ON CONFLICT(antenna_id) DO UPDATE SET x = excluded.x, y = excluded.y;");
  st.BindText(1, antenna.antenna_id);
  st.BindDouble(2, antenna.x);
  st.BindDouble(3, antenna.y);
  st.StepDone();
}

void SqliteReadingStore::UpsertTag(const Tag& tag) {
  ValidateTag(tag);
  Stmt st(p_->db,
          "INSERT INTO tag (tag_id, type, true_x, true_y, pred_x, pred_y, is_read) "
          "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7) "
          "ON CONFLICT(tag_id) DO UPDATE SET type = excluded.type, "
          "true_x = excluded.true_x, true_y = excluded.true_y, "
          "pred_x = excluded.pred_x, pred_y = excluded.pred_y, is_read = excluded.is_read;");
  st.BindText(1, tag.tag_id);
  st.BindText(2, TagRoleToText(tag.role));
  st.BindOptDouble(3, tag.true_x);
  st.BindOptDouble(4, tag.true_y);
  st.BindOptDouble(5, tag.pred_x);
  st.BindOptDouble(6, tag.pred_y);
  st.BindInt64(7, tag.is_read ? 1 : 0);
  st.StepDone();
}

void SqliteReadingStore::InsertReadings(const std::vector<Reading>& readings) {
  if (readings.empty()) return;
  // Inside an open write batch the caller owns the transaction.
  const bool own_txn = !p_->in_txn;
  if (own_txn) Begin();
  try {
    Stmt st(p_->db,
            "INSERT INTO record (tag_id, antenna_id, rc, rssi, read_time) "
            "VALUES (?1, ?2, ?3, ?4, ?5);");
    for (const Reading& r : readings) {
      if (r.read_count < 0) {
        throw rfpos::DataError("Negative read count for tag '" + r.tag_id + "'");
      }
      st.Reset();
      st.BindText(1, r.tag_id);
      st.BindText(2, r.antenna_id);
      st.BindInt64(3, r.read_count);
      st.BindDouble(4, r.rssi);
      st.BindText(5, rfpos::FormatTimestamp(r.timestamp));
      st.StepDone();
    }
    if (own_txn) Commit();
  } catch (...) {
    if (own_txn) Rollback();
    throw;
  }
}

void SqliteReadingStore::SetPredictedPosition(const rfpos::TagId& tag_id, double x, double y) {
  const std::optional<Tag> tag = GetTag(tag_id);
  if (!tag) {
    throw rfpos::StoreError("SetPredictedPosition: unknown tag '" + tag_id + "'");
  }
  if (tag->role == TagRole::REFERENCE) {
    throw rfpos::DataError("Reference tag '" + tag_id + "' must not carry predicted coordinates");
  }
  Stmt st(p_->db, "UPDATE tag SET pred_x = ?2, pred_y = ?3 WHERE tag_id = ?1;");
  st.BindText(1, tag_id);
  st.BindDouble(2, x);
  st.BindDouble(3, y);
  st.StepDone();
}

void SqliteReadingStore::MarkObserved(const rfpos::TagId& tag_id) {
  Stmt st(p_->db, "UPDATE tag SET is_read = 1 WHERE tag_id = ?1;");
  st.BindText(1, tag_id);
  st.StepDone();
  if (sqlite3_changes(p_->db) == 0) {
    throw rfpos::StoreError("MarkObserved: unknown tag '" + tag_id + "'");
  }
}

std::size_t SqliteReadingStore::ReadingCount() const {
  Stmt st(p_->db, "SELECT COUNT(*) FROM record;");
  if (!st.StepRow()) return 0;
  return static_cast<std::size_t>(st.ColumnInt64(0));
}

} // namespace store
