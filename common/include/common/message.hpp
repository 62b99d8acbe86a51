#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace quizsync {

enum class MessageType {
  // client -> hub
  Identify,
  RequestSync,
  SubmitResponse,
  Ping,
  GetStats,
  // hub -> client
  Welcome,
  Identified,
  PeerResponse,
  BulkUpdate,
  SyncResponse,
  UserJoined,
  UserDisconnected,
  ResponseConfirmed,
  Pong,
  Stats,
  Error,
  ServerShutdown,
};

// One tagged message. `type` stays textual so that tags outside the known
// vocabulary survive decoding and can be answered or dropped by the receiver.
struct Message {
  std::string type;
  nlohmann::json data{nlohmann::json::object()};  // every field except "type"
};

std::string to_string(MessageType type);
std::optional<MessageType> message_type_from_string(const std::string& value);

Message make_message(MessageType type, nlohmann::json data = nlohmann::json::object());

// Convert Message <-> JSON with validation. On failure, returns std::nullopt and fills error.
std::optional<Message> message_from_json(const nlohmann::json& j, std::string& error);
nlohmann::json message_to_json(const Message& msg);

// Wall clock in epoch milliseconds.
std::uint64_t now_ms();

}  // namespace quizsync
