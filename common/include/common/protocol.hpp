#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/message.hpp"

namespace quizsync {

// One user's answer to one question. Identity key is (question_id, user_id);
// a resubmission is a new Response that replaces the prior one under that key.
struct Response {
  std::string question_id;
  std::string answer;
  std::string reason;
  std::string user_id;
  std::string display_name;
  std::uint64_t timestamp{0};  // epoch ms, advisory when client supplied
};

nlohmann::json response_to_json(const Response& r);
// A missing timestamp decodes as 0; callers decide the default.
std::optional<Response> response_from_json(const nlohmann::json& j, std::string& error);

nlohmann::json responses_to_json(const std::vector<Response>& responses);

// -- client -> hub ----------------------------------------------------------
Message make_identify(const std::string& user_id, const std::string& display_name);
Message make_request_sync();
Message make_submit_response(const Response& r);
Message make_ping();
Message make_get_stats();

// -- hub -> client, decoded ------------------------------------------------
struct Welcome {
  std::string id;
  std::uint64_t server_time{};
  std::size_t active_user_count{};
};

struct Identified {
  bool success{};
  std::vector<std::string> active_users;
};

struct PeerResponse {
  Response response;
};

struct BulkUpdate {
  std::vector<Response> responses;
};

struct SyncResponse {
  std::vector<Response> responses;
  std::vector<std::string> active_users;
  std::uint64_t timestamp{};
};

struct UserJoined {
  std::string user_id;
  std::string display_name;
  std::size_t active_users{};
};

struct UserDisconnected {
  std::string user_id;
  std::string display_name;
  std::size_t active_users{};
};

struct ResponseConfirmed {
  std::string question_id;
  bool success{};
};

struct Pong {
  std::uint64_t timestamp{};
};

struct Stats {
  std::size_t connected_clients{};
  std::size_t active_users{};
  std::size_t total_responses{};
  std::uint64_t uptime_ms{};
};

struct ErrorNotice {
  std::string message;
};

struct ServerShutdown {
  std::string message;
};

using HubEvent = std::variant<Welcome, Identified, PeerResponse, BulkUpdate, SyncResponse,
                              UserJoined, UserDisconnected, ResponseConfirmed, Pong, Stats,
                              ErrorNotice, ServerShutdown>;

// Decode a hub -> client message. Returns std::nullopt (error filled) for tags
// outside the hub vocabulary or payloads missing required fields.
std::optional<HubEvent> decode_hub_event(const Message& msg, std::string& error);

}  // namespace quizsync
