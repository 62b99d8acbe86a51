#include "client/local_store.hpp"

#include <spdlog/spdlog.h>

namespace quizsync::client {

namespace {

const char* kSchema =
    "CREATE TABLE IF NOT EXISTS cached_responses("
    "  scope TEXT NOT NULL,"
    "  question_id TEXT NOT NULL,"
    "  user_id TEXT NOT NULL,"
    "  answer TEXT NOT NULL,"
    "  reason TEXT NOT NULL DEFAULT '',"
    "  display_name TEXT NOT NULL DEFAULT '',"
    "  timestamp INTEGER NOT NULL,"
    "  PRIMARY KEY(scope, question_id, user_id));"
    "CREATE TABLE IF NOT EXISTS settings("
    "  key TEXT PRIMARY KEY,"
    "  value TEXT NOT NULL);";

const char* scope_name(CacheScope scope) {
  return scope == CacheScope::Own ? "own" : "peer";
}

std::string column_text(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace

LocalStore::LocalStore(std::string db_path) : db_path_(std::move(db_path)) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!open_db()) {
    spdlog::error("[cache] failed to open local store {}", db_path_);
  }
}

LocalStore::~LocalStore() {
  if (db_) sqlite3_close(db_);
}

bool LocalStore::open_db() {
  if (db_) return true;
  if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  char* err = nullptr;
  if (sqlite3_exec(db_, kSchema, nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::error("[cache] schema setup failed: {}", err ? err : "unknown");
    sqlite3_free(err);
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  return true;
}

bool LocalStore::save_response(CacheScope scope, const Response& r, std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return false;
  }
  const char* sql =
      "INSERT OR REPLACE INTO cached_responses"
      "(scope, question_id, user_id, answer, reason, display_name, timestamp) "
      "VALUES(?,?,?,?,?,?,?);";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return false;
  }
  sqlite3_bind_text(stmt, 1, scope_name(scope), -1, SQLITE_STATIC);
  sqlite3_bind_text(stmt, 2, r.question_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, r.user_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, r.answer.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, r.reason.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 6, r.display_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(r.timestamp));

  bool ok = sqlite3_step(stmt) == SQLITE_DONE;
  if (!ok && error) *error = sqlite3_errmsg(db_);
  sqlite3_finalize(stmt);
  return ok;
}

std::vector<Response> LocalStore::load_responses(CacheScope scope, std::string* error) {
  std::vector<Response> out;
  std::lock_guard<std::mutex> lock(mtx_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return out;
  }
  const char* sql =
      "SELECT question_id, user_id, answer, reason, display_name, timestamp "
      "FROM cached_responses WHERE scope = ? ORDER BY question_id, user_id;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return out;
  }
  sqlite3_bind_text(stmt, 1, scope_name(scope), -1, SQLITE_STATIC);
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    Response r;
    r.question_id = column_text(stmt, 0);
    r.user_id = column_text(stmt, 1);
    r.answer = column_text(stmt, 2);
    r.reason = column_text(stmt, 3);
    r.display_name = column_text(stmt, 4);
    r.timestamp = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 5));
    out.push_back(std::move(r));
  }
  sqlite3_finalize(stmt);
  return out;
}

std::optional<std::string> LocalStore::get_setting(const std::string& key, std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT value FROM settings WHERE key = ?;", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  std::optional<std::string> value;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    value = column_text(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return value;
}

bool LocalStore::set_setting(const std::string& key, const std::string& value,
                             std::string* error) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return false;
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "INSERT OR REPLACE INTO settings(key, value) VALUES(?, ?);", -1,
                         &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return false;
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
  bool ok = sqlite3_step(stmt) == SQLITE_DONE;
  if (!ok && error) *error = sqlite3_errmsg(db_);
  sqlite3_finalize(stmt);
  return ok;
}

}  // namespace quizsync::client
