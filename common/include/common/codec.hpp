#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <sys/types.h>

#include "common/message.hpp"

namespace quizsync {

// Frame layout: [u32 big-endian payload length][u8 kind][payload].
enum class FrameKind : std::uint8_t {
  Text = 0x1,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

constexpr std::size_t kFrameLengthBytes = 4;
constexpr std::size_t kFramePrefixBytes = kFrameLengthBytes + 1;
constexpr std::size_t kMaxPayloadSize = 1024 * 1024;  // 1 MiB safeguard.

// Low-level helpers for POSIX socket descriptors.
// Returns total bytes read (0 means EOF) or -1 on unrecoverable error.
ssize_t read_exact(int fd, void* buffer, std::size_t length);
// Returns total bytes written or -1 on unrecoverable error. Never raises SIGPIPE.
ssize_t write_exact(int fd, const void* buffer, std::size_t length);

// Encode a Message into a Text frame.
// On success, returns frame (prefix + JSON). On failure, frame is empty and error is filled.
std::vector<std::uint8_t> encode_frame(const Message& msg, std::string& error);

// Encode a payload-less control frame (Ping, Pong, Close).
std::vector<std::uint8_t> encode_control_frame(FrameKind kind);

// Kind byte of a frame read by read_frame. Frames shorter than the prefix report Close.
FrameKind frame_kind(const std::vector<std::uint8_t>& frame);

// Decode a full Text frame (prefix + payload). Returns true on success, false otherwise.
bool decode_frame(const std::vector<std::uint8_t>& frame, Message& out, std::string& error);

// Read a frame from fd into `frame` (prefix + payload). Returns true on success, false on EOF/error.
bool read_frame(int fd, std::vector<std::uint8_t>& frame, std::string& error);

// Write a fully encoded frame to fd. Returns true on success.
bool write_frame(int fd, const std::vector<std::uint8_t>& frame, std::string& error);

}  // namespace quizsync
