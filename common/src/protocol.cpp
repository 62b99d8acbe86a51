#include "common/protocol.hpp"

#include <spdlog/spdlog.h>

namespace quizsync {

namespace {

bool read_string(const nlohmann::json& j, const char* key, bool required,
                 std::string& out, std::string& error) {
  if (!j.contains(key) || j[key].is_null()) {
    if (required) {
      error = std::string(key) + " missing";
      return false;
    }
    return true;
  }
  if (!j[key].is_string()) {
    error = std::string(key) + " must be string";
    return false;
  }
  out = j[key].get<std::string>();
  return true;
}

std::vector<std::string> read_string_list(const nlohmann::json& j, const char* key) {
  std::vector<std::string> out;
  if (!j.contains(key) || !j[key].is_array()) return out;
  for (const auto& item : j[key]) {
    if (item.is_string()) out.push_back(item.get<std::string>());
  }
  return out;
}

bool read_responses(const nlohmann::json& j, std::vector<Response>& out, std::string& error) {
  if (!j.contains("responses") || !j["responses"].is_array()) {
    error = "responses missing or not array";
    return false;
  }
  // A bad element is skipped; the rest of the batch is still usable.
  std::size_t skipped = 0;
  for (const auto& item : j["responses"]) {
    std::string item_error;
    auto r = response_from_json(item, item_error);
    if (!r) {
      ++skipped;
      spdlog::warn("[protocol] skipping invalid response in batch: {}", item_error);
      continue;
    }
    out.push_back(std::move(*r));
  }
  if (skipped > 0) {
    spdlog::info("[protocol] kept {} of {} batched responses", out.size(),
                 j["responses"].size());
  }
  return true;
}

template <typename T>
T read_number(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_number()) return j[key].get<T>();
  return T{};
}

bool read_bool(const nlohmann::json& j, const char* key) {
  return j.contains(key) && j[key].is_boolean() && j[key].get<bool>();
}

}  // namespace

nlohmann::json response_to_json(const Response& r) {
  nlohmann::json j{{"questionId", r.question_id},
                   {"answer", r.answer},
                   {"userId", r.user_id},
                   {"displayName", r.display_name},
                   {"timestamp", r.timestamp}};
  if (!r.reason.empty()) j["reason"] = r.reason;
  return j;
}

std::optional<Response> response_from_json(const nlohmann::json& j, std::string& error) {
  if (!j.is_object()) {
    error = "response must be JSON object";
    return std::nullopt;
  }
  Response r;
  if (!read_string(j, "questionId", true, r.question_id, error)) return std::nullopt;
  if (!read_string(j, "userId", true, r.user_id, error)) return std::nullopt;
  if (!read_string(j, "answer", true, r.answer, error)) return std::nullopt;
  if (!read_string(j, "reason", false, r.reason, error)) return std::nullopt;
  if (!read_string(j, "displayName", false, r.display_name, error)) return std::nullopt;
  if (r.question_id.empty() || r.user_id.empty()) {
    error = "questionId and userId must be non-empty";
    return std::nullopt;
  }
  if (j.contains("timestamp") && !j["timestamp"].is_null()) {
    if (!j["timestamp"].is_number_unsigned()) {
      error = "timestamp must be unsigned number";
      return std::nullopt;
    }
    r.timestamp = j["timestamp"].get<std::uint64_t>();
  }
  return r;
}

nlohmann::json responses_to_json(const std::vector<Response>& responses) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& r : responses) arr.push_back(response_to_json(r));
  return arr;
}

Message make_identify(const std::string& user_id, const std::string& display_name) {
  return make_message(MessageType::Identify,
                      {{"userId", user_id}, {"displayName", display_name}});
}

Message make_request_sync() {
  return make_message(MessageType::RequestSync);
}

Message make_submit_response(const Response& r) {
  return make_message(MessageType::SubmitResponse, response_to_json(r));
}

Message make_ping() {
  return make_message(MessageType::Ping);
}

Message make_get_stats() {
  return make_message(MessageType::GetStats);
}

std::optional<HubEvent> decode_hub_event(const Message& msg, std::string& error) {
  auto type = message_type_from_string(msg.type);
  if (!type) {
    error = "unknown message type: " + msg.type;
    return std::nullopt;
  }
  const auto& d = msg.data;
  switch (*type) {
    case MessageType::Welcome: {
      Welcome w;
      if (!read_string(d, "id", false, w.id, error)) return std::nullopt;
      w.server_time = read_number<std::uint64_t>(d, "serverTime");
      w.active_user_count = read_number<std::size_t>(d, "activeUserCount");
      return HubEvent{w};
    }
    case MessageType::Identified: {
      Identified ev;
      ev.success = read_bool(d, "success");
      ev.active_users = read_string_list(d, "activeUsers");
      return HubEvent{ev};
    }
    case MessageType::PeerResponse: {
      auto r = response_from_json(d, error);
      if (!r) return std::nullopt;
      return HubEvent{PeerResponse{std::move(*r)}};
    }
    case MessageType::BulkUpdate: {
      BulkUpdate ev;
      if (!read_responses(d, ev.responses, error)) return std::nullopt;
      return HubEvent{ev};
    }
    case MessageType::SyncResponse: {
      SyncResponse ev;
      if (!read_responses(d, ev.responses, error)) return std::nullopt;
      ev.active_users = read_string_list(d, "activeUsers");
      ev.timestamp = read_number<std::uint64_t>(d, "timestamp");
      return HubEvent{ev};
    }
    case MessageType::UserJoined: {
      UserJoined ev;
      if (!read_string(d, "userId", false, ev.user_id, error)) return std::nullopt;
      if (!read_string(d, "displayName", false, ev.display_name, error)) return std::nullopt;
      ev.active_users = read_number<std::size_t>(d, "activeUsers");
      return HubEvent{ev};
    }
    case MessageType::UserDisconnected: {
      UserDisconnected ev;
      if (!read_string(d, "userId", false, ev.user_id, error)) return std::nullopt;
      if (!read_string(d, "displayName", false, ev.display_name, error)) return std::nullopt;
      ev.active_users = read_number<std::size_t>(d, "activeUsers");
      return HubEvent{ev};
    }
    case MessageType::ResponseConfirmed: {
      ResponseConfirmed ev;
      if (!read_string(d, "questionId", false, ev.question_id, error)) return std::nullopt;
      ev.success = read_bool(d, "success");
      return HubEvent{ev};
    }
    case MessageType::Pong:
      return HubEvent{Pong{read_number<std::uint64_t>(d, "timestamp")}};
    case MessageType::Stats: {
      Stats ev;
      ev.connected_clients = read_number<std::size_t>(d, "connectedClients");
      ev.active_users = read_number<std::size_t>(d, "activeUsers");
      ev.total_responses = read_number<std::size_t>(d, "totalResponses");
      ev.uptime_ms = read_number<std::uint64_t>(d, "uptime");
      return HubEvent{ev};
    }
    case MessageType::Error: {
      ErrorNotice ev;
      if (!read_string(d, "message", false, ev.message, error)) return std::nullopt;
      return HubEvent{ev};
    }
    case MessageType::ServerShutdown: {
      ServerShutdown ev;
      if (!read_string(d, "message", false, ev.message, error)) return std::nullopt;
      return HubEvent{ev};
    }
    default:
      break;
  }
  error = "not a hub message: " + msg.type;
  return std::nullopt;
}

}  // namespace quizsync
