#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "common/codec.hpp"
#include "common/protocol.hpp"

using quizsync::Message;

namespace {

int connect_to(const std::string& host, const std::string& port) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &results);
  if (rc != 0) {
    std::cerr << "resolve " << host << ": " << ::gai_strerror(rc) << "\n";
    return -1;
  }
  int fd = -1;
  for (addrinfo* ai = results; ai; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) continue;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(results);
  if (fd < 0) std::perror("connect");
  return fd;
}

bool build_request(const std::string& command, Message& out) {
  if (command == "ping") {
    out = quizsync::make_ping();
  } else if (command == "stats") {
    out = quizsync::make_get_stats();
  } else if (command == "sync") {
    out = quizsync::make_request_sync();
  } else {
    return false;
  }
  return true;
}

std::string expected_reply(const std::string& command) {
  if (command == "ping") return "pong";
  if (command == "stats") return "stats";
  return "sync_response";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <host> <port> [ping|stats|sync]\n";
    return 1;
  }
  std::string host = argv[1];
  std::string port = argv[2];
  std::string command = (argc > 3) ? argv[3] : "ping";

  Message req;
  if (!build_request(command, req)) {
    std::cerr << "unknown command: " << command << "\n";
    return 1;
  }

  int fd = connect_to(host, port);
  if (fd < 0) return 1;
  timeval tv{};
  tv.tv_sec = 5;
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  std::string err;
  auto frame = quizsync::encode_frame(req, err);
  if (frame.empty()) {
    std::cerr << "encode error: " << err << "\n";
    ::close(fd);
    return 1;
  }
  if (!quizsync::write_frame(fd, frame, err)) {
    std::cerr << "write error: " << err << "\n";
    ::close(fd);
    return 1;
  }

  // The hub greets first (welcome, maybe bulk_update); print until the reply arrives.
  const std::string wanted = expected_reply(command);
  int status = 1;
  while (true) {
    std::vector<std::uint8_t> resp_frame;
    if (!quizsync::read_frame(fd, resp_frame, err)) {
      std::cerr << "read error: " << err << "\n";
      break;
    }
    auto kind = quizsync::frame_kind(resp_frame);
    if (kind == quizsync::FrameKind::Ping) {
      quizsync::write_frame(fd, quizsync::encode_control_frame(quizsync::FrameKind::Pong), err);
      continue;
    }
    if (kind != quizsync::FrameKind::Text) continue;

    Message resp;
    if (!quizsync::decode_frame(resp_frame, resp, err)) {
      std::cerr << "decode error: " << err << "\n";
      break;
    }
    std::cout << resp.type << " " << resp.data.dump() << "\n";
    if (resp.type == wanted) {
      status = 0;
      break;
    }
    if (resp.type == "error") break;
  }

  ::close(fd);
  return status;
}
