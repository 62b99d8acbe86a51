#include "client/remote_store.hpp"

#include <memory>

#include <spdlog/spdlog.h>

namespace quizsync::client {

namespace {

const char* kSchema =
    "CREATE TABLE IF NOT EXISTS responses("
    "  question_id TEXT NOT NULL,"
    "  user_id TEXT NOT NULL,"
    "  answer TEXT NOT NULL,"
    "  reason TEXT NOT NULL DEFAULT '',"
    "  display_name TEXT NOT NULL DEFAULT '',"
    "  timestamp INTEGER NOT NULL,"
    "  PRIMARY KEY(question_id, user_id));";

std::string column_text(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace

std::optional<Identity> LocalIdentity::current_identity() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return identity_;
}

void LocalIdentity::sign_in(Identity identity) {
  std::lock_guard<std::mutex> lock(mtx_);
  identity_ = std::move(identity);
}

void LocalIdentity::sign_out() {
  std::lock_guard<std::mutex> lock(mtx_);
  identity_.reset();
}

SqliteRemoteStore::SqliteRemoteStore(std::string db_path) : db_path_(std::move(db_path)) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    spdlog::error("[remote] failed to open {}", db_path_);
  }
}

SqliteRemoteStore::~SqliteRemoteStore() {
  if (db_) sqlite3_close(db_);
}

bool SqliteRemoteStore::open_db() {
  if (db_) return true;
  if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  char* err = nullptr;
  if (sqlite3_exec(db_, kSchema, nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::error("[remote] schema setup failed: {}", err ? err : "unknown");
    sqlite3_free(err);
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  return true;
}

bool SqliteRemoteStore::write_response(const Response& r, std::string* error) {
  {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    if (!open_db()) {
      if (error) *error = "DB open failed";
      return false;
    }
    // Last write wins by timestamp: an older write leaves the stored row alone
    // and still counts as accepted.
    const char* sql =
        "INSERT INTO responses(question_id, user_id, answer, reason, display_name, timestamp) "
        "VALUES(?,?,?,?,?,?) "
        "ON CONFLICT(question_id, user_id) DO UPDATE SET "
        "  answer = excluded.answer,"
        "  reason = excluded.reason,"
        "  display_name = excluded.display_name,"
        "  timestamp = excluded.timestamp "
        "WHERE excluded.timestamp >= responses.timestamp;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      if (error) *error = sqlite3_errmsg(db_);
      return false;
    }
    sqlite3_bind_text(stmt, 1, r.question_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, r.user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, r.answer.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, r.reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, r.display_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(r.timestamp));
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
      if (error) *error = sqlite3_errmsg(db_);
      sqlite3_finalize(stmt);
      return false;
    }
    sqlite3_finalize(stmt);
  }
  notify(r.question_id);
  return true;
}

std::vector<Response> SqliteRemoteStore::query_responses(const std::string& question_id) {
  std::vector<Response> out;
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) return out;
  const char* sql =
      "SELECT question_id, user_id, answer, reason, display_name, timestamp "
      "FROM responses WHERE question_id = ? ORDER BY timestamp;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    spdlog::warn("[remote] query failed: {}", sqlite3_errmsg(db_));
    return out;
  }
  sqlite3_bind_text(stmt, 1, question_id.c_str(), -1, SQLITE_TRANSIENT);
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

RemoteStore::Unsubscribe SqliteRemoteStore::subscribe(const std::string& question_id,
                                                      Listener listener) {
  std::uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(listeners_mtx_);
    id = next_listener_id_++;
    listeners_[id] = {question_id, listener};
  }
  listener(query_responses(question_id));
  return [this, id] {
    std::lock_guard<std::mutex> lock(listeners_mtx_);
    listeners_.erase(id);
  };
}

void SqliteRemoteStore::notify(const std::string& question_id) {
  std::vector<Listener> targets;
  {
    std::lock_guard<std::mutex> lock(listeners_mtx_);
    for (const auto& [id, entry] : listeners_) {
      if (entry.first == question_id) targets.push_back(entry.second);
    }
  }
  if (targets.empty()) return;
  auto snapshot = query_responses(question_id);
  for (const auto& fn : targets) fn(snapshot);
}

}  // namespace quizsync::client
