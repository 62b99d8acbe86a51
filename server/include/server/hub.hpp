#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "common/message.hpp"
#include "common/protocol.hpp"

namespace quizsync::server {

struct HubConfig {
  std::string host{"0.0.0.0"};
  std::uint16_t port{8080};
  std::chrono::milliseconds heartbeat_interval{30000};
  std::chrono::milliseconds cleanup_interval{60000};
  std::chrono::milliseconds retention_window{3600000};
};

// Command-line and environment values for HubConfig. Both reject anything but
// plain decimal digits; a port must be 1-65535 and a period at least 1 ms.
std::optional<std::uint16_t> parse_port(const std::string& value);
std::optional<std::chrono::milliseconds> parse_period(const std::string& value);

// The Hub's view of one accepted connection. Implementations must not block
// the caller: sends are queued, and a failed send is dropped silently.
class Peer {
 public:
  virtual ~Peer() = default;

  virtual void send(const quizsync::Message& msg) = 0;
  // Transport-level liveness probe; the answer arrives through Hub::on_pong.
  virtual void send_ping() = 0;
  // Flush queued frames, then close.
  virtual void close() = 0;
  // Drop the socket immediately.
  virtual void terminate() = 0;
  virtual std::string address() const = 0;
};

struct ConnectionInfo {
  std::string id;
  std::string user_id;  // empty until identify
  std::string display_name;
  bool is_alive{true};
  std::uint64_t connected_at{0};
  std::shared_ptr<Peer> peer;
};

struct HubSession {
  // question_id -> user_id -> Response
  std::map<std::string, std::map<std::string, Response>> responses;
  std::set<std::string> active_users;
  // connection id -> connection
  std::map<std::string, ConnectionInfo> connections;
  std::uint64_t started_at{0};
  std::uint64_t total_connections{0};
};

// Classroom relay state machine. Owns the HubSession and is its only mutator.
// Not thread-safe: every entry point must be called from one serialized
// executor (see Server).
class Hub {
 public:
  using Clock = std::function<std::uint64_t()>;

  explicit Hub(std::chrono::milliseconds retention_window = std::chrono::milliseconds(3600000),
               Clock clock = Clock());

  Hub(const Hub&) = delete;
  Hub& operator=(const Hub&) = delete;

  // Registers the connection, sends welcome and, when data exists, a proactive
  // bulk_update. Returns the allocated connection id.
  std::string on_accept(std::shared_ptr<Peer> peer);
  void on_message(const std::string& conn_id, const quizsync::Message& msg);
  // A frame that failed to decode: answered with an error, connection kept.
  void on_malformed(const std::string& conn_id, const std::string& reason);
  void on_pong(const std::string& conn_id);
  void on_close(const std::string& conn_id);

  // Terminates connections that missed the previous probe, then probes the rest.
  // Returns the number of terminated connections.
  std::size_t liveness_sweep();
  // Drops responses older than the retention window. Returns the number removed.
  std::size_t retention_sweep();
  // Broadcasts server_shutdown and closes every connection.
  void shutdown();

  std::size_t connection_count() const { return session_.connections.size(); }
  std::size_t active_user_count() const { return session_.active_users.size(); }
  std::size_t response_count() const;
  std::vector<Response> all_responses() const;
  std::optional<Response> find_response(const std::string& question_id,
                                        const std::string& user_id) const;
  bool is_active(const std::string& user_id) const;
  std::optional<ConnectionInfo> connection(const std::string& conn_id) const;

 private:
  using HandlerFn = std::function<void(ConnectionInfo&, const quizsync::Message&)>;

  void register_handler(MessageType type, HandlerFn handler);

  void handle_identify(ConnectionInfo& conn, const quizsync::Message& msg);
  void handle_submit_response(ConnectionInfo& conn, const quizsync::Message& msg);
  void handle_request_sync(ConnectionInfo& conn, const quizsync::Message& msg);
  void handle_ping(ConnectionInfo& conn, const quizsync::Message& msg);
  void handle_get_stats(ConnectionInfo& conn, const quizsync::Message& msg);

  void send_to(ConnectionInfo& conn, const quizsync::Message& msg);
  void send_error(ConnectionInfo& conn, const std::string& message);
  void broadcast(const quizsync::Message& msg, const std::string& except_id = std::string());
  std::vector<std::string> active_user_list() const;
  std::string next_connection_id();

  std::chrono::milliseconds retention_window_;
  Clock clock_;
  HubSession session_;
  std::map<std::string, HandlerFn> handlers_;
  std::mt19937_64 rng_;
};

}  // namespace quizsync::server
