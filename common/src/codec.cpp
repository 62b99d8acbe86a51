#include "common/codec.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace quizsync {
namespace {

bool is_valid_utf8(const std::string& s) {
  const unsigned char* bytes =
      reinterpret_cast<const unsigned char*>(s.data());
  std::size_t len = s.size();
  std::size_t i = 0;
  while (i < len) {
    unsigned char c = bytes[i];
    std::size_t remaining = 0;
    if (c <= 0x7F) {
      remaining = 0;
    } else if ((c >> 5) == 0x6) {
      remaining = 1;
      if ((c & 0x1E) == 0) return false;
    } else if ((c >> 4) == 0xE) {
      remaining = 2;
    } else if ((c >> 3) == 0x1E) {
      remaining = 3;
    } else {
      return false;
    }
    if (i + remaining >= len) return false;
    for (std::size_t j = 1; j <= remaining; ++j) {
      if ((bytes[i + j] >> 6) != 0x2) return false;
    }
    i += remaining + 1;
  }
  return true;
}

std::uint32_t to_be32(std::uint32_t value) {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

std::uint32_t from_be32(std::uint32_t value) {
  return to_be32(value);
}

bool is_known_kind(std::uint8_t kind) {
  return kind == static_cast<std::uint8_t>(FrameKind::Text) ||
         kind == static_cast<std::uint8_t>(FrameKind::Close) ||
         kind == static_cast<std::uint8_t>(FrameKind::Ping) ||
         kind == static_cast<std::uint8_t>(FrameKind::Pong);
}

std::vector<std::uint8_t> make_frame(FrameKind kind, const std::string& payload) {
  std::vector<std::uint8_t> frame(kFramePrefixBytes + payload.size());
  std::uint32_t len = to_be32(static_cast<std::uint32_t>(payload.size()));
  std::memcpy(frame.data(), &len, sizeof(len));
  frame[kFrameLengthBytes] = static_cast<std::uint8_t>(kind);
  if (!payload.empty()) {
    std::memcpy(frame.data() + kFramePrefixBytes, payload.data(), payload.size());
  }
  return frame;
}

}  // namespace

// Message helpers implementation
std::string to_string(MessageType type) {
  switch (type) {
    case MessageType::Identify:
      return "identify";
    case MessageType::RequestSync:
      return "request_sync";
    case MessageType::SubmitResponse:
      return "submit_response";
    case MessageType::Ping:
      return "ping";
    case MessageType::GetStats:
      return "get_stats";
    case MessageType::Welcome:
      return "welcome";
    case MessageType::Identified:
      return "identified";
    case MessageType::PeerResponse:
      return "peer_response";
    case MessageType::BulkUpdate:
      return "bulk_update";
    case MessageType::SyncResponse:
      return "sync_response";
    case MessageType::UserJoined:
      return "user_joined";
    case MessageType::UserDisconnected:
      return "user_disconnected";
    case MessageType::ResponseConfirmed:
      return "response_confirmed";
    case MessageType::Pong:
      return "pong";
    case MessageType::Stats:
      return "stats";
    case MessageType::Error:
      return "error";
    case MessageType::ServerShutdown:
      return "server_shutdown";
  }
  return "error";
}

std::optional<MessageType> message_type_from_string(const std::string& value) {
  if (value == "identify") return MessageType::Identify;
  if (value == "request_sync") return MessageType::RequestSync;
  if (value == "submit_response") return MessageType::SubmitResponse;
  if (value == "ping") return MessageType::Ping;
  if (value == "get_stats") return MessageType::GetStats;
  if (value == "welcome") return MessageType::Welcome;
  if (value == "identified") return MessageType::Identified;
  if (value == "peer_response") return MessageType::PeerResponse;
  if (value == "bulk_update") return MessageType::BulkUpdate;
  if (value == "sync_response") return MessageType::SyncResponse;
  if (value == "user_joined") return MessageType::UserJoined;
  if (value == "user_disconnected") return MessageType::UserDisconnected;
  if (value == "response_confirmed") return MessageType::ResponseConfirmed;
  if (value == "pong") return MessageType::Pong;
  if (value == "stats") return MessageType::Stats;
  if (value == "error") return MessageType::Error;
  if (value == "server_shutdown") return MessageType::ServerShutdown;
  return std::nullopt;
}

Message make_message(MessageType type, nlohmann::json data) {
  Message msg;
  msg.type = to_string(type);
  msg.data = data.is_null() ? nlohmann::json::object() : std::move(data);
  return msg;
}

std::optional<Message> message_from_json(const nlohmann::json& j,
                                         std::string& error) {
  if (!j.is_object()) {
    error = "Message must be a JSON object";
    return std::nullopt;
  }
  if (!j.contains("type") || !j["type"].is_string() ||
      j["type"].get<std::string>().empty()) {
    error = "type missing or empty";
    return std::nullopt;
  }

  Message msg;
  msg.type = j["type"].get<std::string>();
  msg.data = j;
  msg.data.erase("type");
  return msg;
}

nlohmann::json message_to_json(const Message& msg) {
  nlohmann::json j = msg.data.is_object() ? msg.data : nlohmann::json::object();
  j["type"] = msg.type;
  return j;
}

std::uint64_t now_ms() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

ssize_t read_exact(int fd, void* buffer, std::size_t length) {
  auto* out = static_cast<std::uint8_t*>(buffer);
  std::size_t total = 0;
  while (total < length) {
    ssize_t n = ::read(fd, out + total, length - total);
    if (n == 0) {
      return static_cast<ssize_t>(total);  // EOF
    }
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    total += static_cast<std::size_t>(n);
  }
  return static_cast<ssize_t>(total);
}

ssize_t write_exact(int fd, const void* buffer, std::size_t length) {
  const auto* in = static_cast<const std::uint8_t*>(buffer);
  std::size_t total = 0;
  while (total < length) {
    ssize_t n = ::send(fd, in + total, length - total, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    total += static_cast<std::size_t>(n);
  }
  return static_cast<ssize_t>(total);
}

std::vector<std::uint8_t> encode_frame(const Message& msg, std::string& error) {
  if (msg.type.empty()) {
    error = "message type empty";
    return {};
  }
  std::string json_str;
  try {
    json_str = message_to_json(msg).dump();
  } catch (const std::exception& ex) {
    error = std::string("JSON dump error: ") + ex.what();
    return {};
  }
  if (json_str.size() > kMaxPayloadSize) {
    error = "payload too large";
    return {};
  }
  if (!is_valid_utf8(json_str)) {
    error = "payload not valid UTF-8";
    return {};
  }
  return make_frame(FrameKind::Text, json_str);
}

std::vector<std::uint8_t> encode_control_frame(FrameKind kind) {
  return make_frame(kind, std::string());
}

FrameKind frame_kind(const std::vector<std::uint8_t>& frame) {
  if (frame.size() < kFramePrefixBytes) return FrameKind::Close;
  return static_cast<FrameKind>(frame[kFrameLengthBytes]);
}

bool decode_frame(const std::vector<std::uint8_t>& frame, Message& out,
                  std::string& error) {
  if (frame.size() < kFramePrefixBytes) {
    error = "frame too small";
    return false;
  }
  std::uint32_t be_len = 0;
  std::memcpy(&be_len, frame.data(), sizeof(be_len));
  const std::uint32_t payload_len = from_be32(be_len);
  if (payload_len > kMaxPayloadSize) {
    error = "payload too large";
    return false;
  }
  if (frame.size() != kFramePrefixBytes + payload_len) {
    error = "payload length mismatch";
    return false;
  }
  if (frame_kind(frame) != FrameKind::Text) {
    error = "not a text frame";
    return false;
  }

  std::string payload(reinterpret_cast<const char*>(frame.data() + kFramePrefixBytes),
                      payload_len);
  if (!is_valid_utf8(payload)) {
    error = "payload not valid UTF-8";
    return false;
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(payload);
  } catch (const std::exception& ex) {
    error = std::string("JSON parse error: ") + ex.what();
    return false;
  }

  auto msg = message_from_json(j, error);
  if (!msg) return false;
  out = std::move(*msg);
  return true;
}

bool read_frame(int fd, std::vector<std::uint8_t>& frame, std::string& error) {
  std::array<std::uint8_t, kFramePrefixBytes> prefix{};
  ssize_t n = read_exact(fd, prefix.data(), prefix.size());
  if (n == 0) {
    error = "EOF";
    return false;
  }
  if (n != static_cast<ssize_t>(prefix.size())) {
    error = "failed to read frame prefix";
    return false;
  }
  std::uint32_t be_len = 0;
  std::memcpy(&be_len, prefix.data(), sizeof(be_len));
  const std::uint32_t payload_len = from_be32(be_len);
  if (payload_len > kMaxPayloadSize) {
    error = "payload too large";
    return false;
  }
  if (!is_known_kind(prefix[kFrameLengthBytes])) {
    error = "unknown frame kind";
    return false;
  }

  frame.resize(kFramePrefixBytes + payload_len);
  std::memcpy(frame.data(), prefix.data(), kFramePrefixBytes);
  if (payload_len == 0) {
    return true;
  }

  ssize_t r = read_exact(fd, frame.data() + kFramePrefixBytes, payload_len);
  if (r != static_cast<ssize_t>(payload_len)) {
    error = "failed to read payload";
    return false;
  }
  return true;
}

bool write_frame(int fd, const std::vector<std::uint8_t>& frame,
                 std::string& error) {
  if (frame.size() < kFramePrefixBytes) {
    error = "frame too small to write";
    return false;
  }
  ssize_t n = write_exact(fd, frame.data(), frame.size());
  if (n != static_cast<ssize_t>(frame.size())) {
    error = "failed to write full frame";
    return false;
  }
  return true;
}

}  // namespace quizsync
