#include "server/hub.hpp"

#include <algorithm>
#include <sstream>

#include <spdlog/spdlog.h>

namespace quizsync::server {

Hub::Hub(std::chrono::milliseconds retention_window, Clock clock)
    : retention_window_(retention_window),
      clock_(clock ? std::move(clock) : Clock(&quizsync::now_ms)),
      rng_(std::random_device{}()) {
  session_.started_at = clock_();

  register_handler(MessageType::Identify,
                   [this](ConnectionInfo& c, const Message& m) { handle_identify(c, m); });
  register_handler(MessageType::SubmitResponse,
                   [this](ConnectionInfo& c, const Message& m) { handle_submit_response(c, m); });
  register_handler(MessageType::RequestSync,
                   [this](ConnectionInfo& c, const Message& m) { handle_request_sync(c, m); });
  register_handler(MessageType::Ping,
                   [this](ConnectionInfo& c, const Message& m) { handle_ping(c, m); });
  register_handler(MessageType::GetStats,
                   [this](ConnectionInfo& c, const Message& m) { handle_get_stats(c, m); });
}

void Hub::register_handler(MessageType type, HandlerFn handler) {
  handlers_[to_string(type)] = std::move(handler);
}

std::string Hub::on_accept(std::shared_ptr<Peer> peer) {
  ConnectionInfo info;
  info.id = next_connection_id();
  info.connected_at = clock_();
  info.is_alive = true;
  info.peer = std::move(peer);
  const std::string id = info.id;
  auto& conn = session_.connections[id];
  conn = std::move(info);
  ++session_.total_connections;

  spdlog::info("[hub] new client {} from {}", id, conn.peer ? conn.peer->address() : "?");

  send_to(conn, make_message(MessageType::Welcome,
                             {{"id", id},
                              {"serverTime", clock_()},
                              {"activeUserCount", session_.active_users.size()},
                              {"message", "Connected to Local Hub successfully"}}));

  // Proactive sync: a client that never sends request_sync still converges.
  if (!session_.responses.empty()) {
    send_to(conn, make_message(MessageType::BulkUpdate,
                               {{"responses", responses_to_json(all_responses())},
                                {"message", "Syncing existing classroom data"}}));
  }
  return id;
}

void Hub::on_message(const std::string& conn_id, const Message& msg) {
  auto it = session_.connections.find(conn_id);
  if (it == session_.connections.end()) {
    spdlog::warn("[hub] message {} for unknown connection {}", msg.type, conn_id);
    return;
  }
  auto handler = handlers_.find(msg.type);
  if (handler == handlers_.end()) {
    spdlog::warn("[hub] unknown message type '{}' from {}", msg.type, conn_id);
    send_error(it->second, "Unknown message type: " + msg.type);
    return;
  }
  handler->second(it->second, msg);
}

void Hub::on_malformed(const std::string& conn_id, const std::string& reason) {
  auto it = session_.connections.find(conn_id);
  if (it == session_.connections.end()) return;
  spdlog::warn("[hub] failed to parse message from {}: {}", conn_id, reason);
  send_error(it->second, "Invalid message format");
}

void Hub::on_pong(const std::string& conn_id) {
  auto it = session_.connections.find(conn_id);
  if (it != session_.connections.end()) it->second.is_alive = true;
}

void Hub::on_close(const std::string& conn_id) {
  auto it = session_.connections.find(conn_id);
  if (it == session_.connections.end()) return;
  ConnectionInfo closed = std::move(it->second);
  session_.connections.erase(it);

  spdlog::info("[hub] client disconnected: {}", conn_id);
  if (closed.user_id.empty()) return;

  // Stored responses for this user are kept for late joiners.
  session_.active_users.erase(closed.user_id);
  broadcast(make_message(MessageType::UserDisconnected,
                         {{"userId", closed.user_id},
                          {"displayName", closed.display_name},
                          {"activeUsers", session_.active_users.size()}}));
}

std::size_t Hub::liveness_sweep() {
  std::size_t terminated = 0;
  for (auto& [id, conn] : session_.connections) {
    if (!conn.is_alive) {
      spdlog::info("[hub] terminating inactive client: {}", id);
      // The close handler runs once the transport reports the socket closed.
      if (conn.peer) conn.peer->terminate();
      ++terminated;
      continue;
    }
    conn.is_alive = false;
    if (conn.peer) conn.peer->send_ping();
  }
  return terminated;
}

std::size_t Hub::retention_sweep() {
  const std::uint64_t now = clock_();
  const auto window = static_cast<std::uint64_t>(retention_window_.count());
  const std::uint64_t cutoff = now > window ? now - window : 0;

  std::size_t removed = 0;
  for (auto q = session_.responses.begin(); q != session_.responses.end();) {
    auto& by_user = q->second;
    for (auto u = by_user.begin(); u != by_user.end();) {
      if (u->second.timestamp < cutoff) {
        u = by_user.erase(u);
        ++removed;
      } else {
        ++u;
      }
    }
    if (by_user.empty()) {
      q = session_.responses.erase(q);
    } else {
      ++q;
    }
  }
  if (removed > 0) {
    spdlog::info("[hub] removed {} old responses", removed);
  }
  return removed;
}

void Hub::shutdown() {
  spdlog::info("[hub] shutting down, notifying {} clients", session_.connections.size());
  broadcast(make_message(MessageType::ServerShutdown,
                         {{"message", "Local Hub server is shutting down"}}));
  for (auto& [id, conn] : session_.connections) {
    if (conn.peer) conn.peer->close();
  }
}

std::size_t Hub::response_count() const {
  std::size_t total = 0;
  for (const auto& [question_id, by_user] : session_.responses) total += by_user.size();
  return total;
}

std::vector<Response> Hub::all_responses() const {
  std::vector<Response> out;
  out.reserve(response_count());
  for (const auto& [question_id, by_user] : session_.responses) {
    for (const auto& [user_id, r] : by_user) out.push_back(r);
  }
  return out;
}

std::optional<Response> Hub::find_response(const std::string& question_id,
                                           const std::string& user_id) const {
  auto q = session_.responses.find(question_id);
  if (q == session_.responses.end()) return std::nullopt;
  auto u = q->second.find(user_id);
  if (u == q->second.end()) return std::nullopt;
  return u->second;
}

bool Hub::is_active(const std::string& user_id) const {
  return session_.active_users.count(user_id) > 0;
}

std::optional<ConnectionInfo> Hub::connection(const std::string& conn_id) const {
  auto it = session_.connections.find(conn_id);
  if (it == session_.connections.end()) return std::nullopt;
  return it->second;
}

// -- handlers ----------------------------------------------------------------

void Hub::handle_identify(ConnectionInfo& conn, const Message& msg) {
  const auto& d = msg.data;
  if (!d.contains("userId") || !d["userId"].is_string() ||
      d["userId"].get<std::string>().empty()) {
    send_error(conn, "identify requires userId");
    return;
  }
  std::string user_id = d["userId"].get<std::string>();
  std::string display_name = "Anonymous";
  if (d.contains("displayName") && d["displayName"].is_string() &&
      !d["displayName"].get<std::string>().empty()) {
    display_name = d["displayName"].get<std::string>();
  }

  if (!conn.user_id.empty() && conn.user_id != user_id) {
    session_.active_users.erase(conn.user_id);
  }
  conn.user_id = user_id;
  conn.display_name = display_name;
  session_.active_users.insert(user_id);

  spdlog::info("[hub] user {} ({}) identified on {}", display_name, user_id, conn.id);

  broadcast(make_message(MessageType::UserJoined,
                         {{"userId", user_id},
                          {"displayName", display_name},
                          {"activeUsers", session_.active_users.size()}}),
            conn.id);
  send_to(conn, make_message(MessageType::Identified,
                             {{"success", true}, {"activeUsers", active_user_list()}}));
}

void Hub::handle_submit_response(ConnectionInfo& conn, const Message& msg) {
  std::string error;
  auto response = response_from_json(msg.data, error);
  if (!response) {
    spdlog::warn("[hub] rejected submit_response from {}: {}", conn.id, error);
    send_error(conn, "Invalid submit_response: " + error);
    return;
  }
  if (response->timestamp == 0) response->timestamp = clock_();

  // Last write at the hub wins; timestamps are not compared here.
  session_.responses[response->question_id][response->user_id] = *response;

  spdlog::info("[hub] user {} submitted answer for question {}", response->display_name,
               response->question_id);

  broadcast(make_message(MessageType::PeerResponse, response_to_json(*response)), conn.id);
  send_to(conn, make_message(MessageType::ResponseConfirmed,
                             {{"questionId", response->question_id}, {"success", true}}));
}

void Hub::handle_request_sync(ConnectionInfo& conn, const Message&) {
  spdlog::info("[hub] {} requested data sync",
               conn.display_name.empty() ? conn.id : conn.display_name);
  send_to(conn, make_message(MessageType::SyncResponse,
                             {{"responses", responses_to_json(all_responses())},
                              {"activeUsers", active_user_list()},
                              {"timestamp", clock_()}}));
}

void Hub::handle_ping(ConnectionInfo& conn, const Message&) {
  send_to(conn, make_message(MessageType::Pong, {{"timestamp", clock_()}}));
}

void Hub::handle_get_stats(ConnectionInfo& conn, const Message&) {
  const std::uint64_t now = clock_();
  send_to(conn, make_message(MessageType::Stats,
                             {{"connectedClients", session_.connections.size()},
                              {"activeUsers", session_.active_users.size()},
                              {"totalResponses", response_count()},
                              {"totalConnections", session_.total_connections},
                              {"uptime", now > session_.started_at ? now - session_.started_at : 0}}));
}

// -- helpers -----------------------------------------------------------------

void Hub::send_to(ConnectionInfo& conn, const Message& msg) {
  if (conn.peer) conn.peer->send(msg);
}

void Hub::send_error(ConnectionInfo& conn, const std::string& message) {
  send_to(conn, make_message(MessageType::Error, {{"message", message}}));
}

void Hub::broadcast(const Message& msg, const std::string& except_id) {
  for (auto& [id, conn] : session_.connections) {
    if (id == except_id) continue;
    send_to(conn, msg);
  }
}

std::vector<std::string> Hub::active_user_list() const {
  return std::vector<std::string>(session_.active_users.begin(), session_.active_users.end());
}

std::string Hub::next_connection_id() {
  std::ostringstream oss;
  oss << "client_" << clock_() << "_" << std::hex << rng_();
  return oss.str();
}

namespace {

std::optional<unsigned long long> parse_digits(const std::string& value, std::size_t max_len) {
  if (value.empty() || value.size() > max_len) return std::nullopt;
  if (!std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  return std::stoull(value);
}

}  // namespace

std::optional<std::uint16_t> parse_port(const std::string& value) {
  auto n = parse_digits(value, 5);
  if (!n || *n == 0 || *n > 65535) return std::nullopt;
  return static_cast<std::uint16_t>(*n);
}

std::optional<std::chrono::milliseconds> parse_period(const std::string& value) {
  auto n = parse_digits(value, 12);
  if (!n || *n == 0) return std::nullopt;
  return std::chrono::milliseconds(static_cast<long long>(*n));
}

}  // namespace quizsync::server
