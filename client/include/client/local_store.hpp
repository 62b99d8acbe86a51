#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "common/protocol.hpp"

namespace quizsync::client {

enum class CacheScope { Own, Peer };

// SQLite persistence behind LocalCache plus the small key-value slot used for
// settings such as the last relay address.
class LocalStore {
 public:
  explicit LocalStore(std::string db_path);
  ~LocalStore();

  LocalStore(const LocalStore&) = delete;
  LocalStore& operator=(const LocalStore&) = delete;

  bool is_open() const { return db_ != nullptr; }

  bool save_response(CacheScope scope, const quizsync::Response& r, std::string* error = nullptr);
  std::vector<quizsync::Response> load_responses(CacheScope scope, std::string* error = nullptr);

  std::optional<std::string> get_setting(const std::string& key, std::string* error = nullptr);
  bool set_setting(const std::string& key, const std::string& value, std::string* error = nullptr);

 private:
  bool open_db();

  std::string db_path_;
  sqlite3* db_{nullptr};
  std::mutex mtx_;
};

}  // namespace quizsync::client
