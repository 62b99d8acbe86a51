#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "common/protocol.hpp"

namespace quizsync::client {

struct Identity {
  std::string user_id;
  std::string display_name;
};

// The durable, authoritative response store reached when the device is online.
// Its write path is where last-write-wins by timestamp is decided.
class RemoteStore {
 public:
  using Listener = std::function<void(const std::vector<quizsync::Response>&)>;
  using Unsubscribe = std::function<void()>;

  virtual ~RemoteStore() = default;

  virtual bool write_response(const quizsync::Response& r, std::string* error = nullptr) = 0;
  virtual std::vector<quizsync::Response> query_responses(const std::string& question_id) = 0;
  virtual Unsubscribe subscribe(const std::string& question_id, Listener listener) = 0;
};

class IdentityProvider {
 public:
  virtual ~IdentityProvider() = default;
  virtual std::optional<Identity> current_identity() const = 0;
};

// In-process identity: whoever signed in on this device.
class LocalIdentity : public IdentityProvider {
 public:
  LocalIdentity() = default;
  explicit LocalIdentity(Identity identity) : identity_(std::move(identity)) {}

  std::optional<Identity> current_identity() const override;
  void sign_in(Identity identity);
  void sign_out();

 private:
  mutable std::mutex mtx_;
  std::optional<Identity> identity_;
};

// RemoteStore over an SQLite database shared by the class. A write only
// replaces the stored row when its timestamp is not older.
class SqliteRemoteStore : public RemoteStore {
 public:
  explicit SqliteRemoteStore(std::string db_path);
  ~SqliteRemoteStore() override;

  SqliteRemoteStore(const SqliteRemoteStore&) = delete;
  SqliteRemoteStore& operator=(const SqliteRemoteStore&) = delete;

  bool write_response(const quizsync::Response& r, std::string* error = nullptr) override;
  std::vector<quizsync::Response> query_responses(const std::string& question_id) override;
  Unsubscribe subscribe(const std::string& question_id, Listener listener) override;

 private:
  bool open_db();
  void notify(const std::string& question_id);

  std::string db_path_;
  sqlite3* db_{nullptr};
  std::recursive_mutex db_mutex_;

  std::mutex listeners_mtx_;
  std::uint64_t next_listener_id_{1};
  std::map<std::uint64_t, std::pair<std::string, Listener>> listeners_;
};

}  // namespace quizsync::client
