#include "server/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <future>
#include <sstream>

#include <spdlog/spdlog.h>

#include "common/codec.hpp"

namespace quizsync::server {

namespace {

constexpr int kSendTimeoutSeconds = 5;

int create_listen_socket(const std::string& host, uint16_t port, std::string* error) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    if (error) *error = std::string("socket: ") + std::strerror(errno);
    return -1;
  }
  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    if (error) *error = "invalid host: " + host;
    ::close(fd);
    return -1;
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    if (error) *error = std::string("bind: ") + std::strerror(errno);
    ::close(fd);
    return -1;
  }
  if (::listen(fd, 64) < 0) {
    if (error) *error = std::string("listen: ") + std::strerror(errno);
    ::close(fd);
    return -1;
  }
  return fd;
}

std::uint16_t local_port(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    return ntohs(addr.sin_port);
  }
  return 0;
}

std::string peer_addr(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    char buf[64];
    ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    std::ostringstream oss;
    oss << buf << ":" << ntohs(addr.sin_port);
    return oss.str();
  }
  return "unknown";
}

}  // namespace

Server::Server(HubConfig config)
    : config_(std::move(config)), hub_(config_.retention_window) {}

Server::~Server() {
  stop();
}

bool Server::start(std::string* error) {
  if (running_.load()) return true;
  if (config_.heartbeat_interval.count() <= 0 || config_.cleanup_interval.count() <= 0) {
    if (error) *error = "sweep intervals must be positive";
    return false;
  }
  listen_fd_ = create_listen_socket(config_.host, config_.port, error);
  if (listen_fd_ < 0) return false;
  bound_port_ = local_port(listen_fd_);
  running_.store(true);
  accept_thread_ = std::thread(&Server::accept_loop, this);
  sweep_thread_ = std::thread(&Server::sweep_loop, this);
  spdlog::info("[server] listening on {}:{}", config_.host, bound_port_);
  return true;
}

void Server::stop() {
  if (!running_.exchange(false)) return;
  {
    std::lock_guard<std::mutex> lock(sweep_mtx_);
  }
  sweep_cv_.notify_all();
  if (listen_fd_ >= 0) ::shutdown(listen_fd_, SHUT_RDWR);
  if (accept_thread_.joinable()) accept_thread_.join();
  if (sweep_thread_.joinable()) sweep_thread_.join();
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }

  with_hub([](Hub& hub) { hub.shutdown(); });
  close_all_connections();
  dispatcher_.shutdown();
  spdlog::info("[server] stopped");
}

void Server::with_hub(const std::function<void(Hub&)>& fn) {
  if (dispatcher_.is_worker_thread()) {
    fn(hub_);
    return;
  }
  std::promise<void> done;
  auto finished = done.get_future();
  bool queued = dispatcher_.enqueue([this, &fn, &done] {
    try {
      fn(hub_);
    } catch (const std::exception& ex) {
      spdlog::error("[server] hub task failed: {}", ex.what());
    }
    done.set_value();
  });
  if (queued) finished.wait();
}

void Server::accept_loop() {
  while (running_.load()) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    if (client_fd < 0) {
      if (errno == EINTR) continue;
      if (!running_.load()) break;
      spdlog::warn("[server] accept: {}", std::strerror(errno));
      continue;
    }
    // A peer that stops draining can hold a writer for at most this long.
    timeval tv{};
    tv.tv_sec = kSendTimeoutSeconds;
    ::setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    auto conn = std::make_shared<Connection>(client_fd, this, peer_addr(client_fd));
    {
      std::lock_guard<std::mutex> lock(conns_mtx_);
      connections_.push_back(conn);
    }
    dispatcher_.enqueue([this, conn] { conn->set_id(hub_.on_accept(conn)); });
    conn->start();
  }
}

void Server::sweep_loop() {
  using clock = std::chrono::steady_clock;
  auto next_heartbeat = clock::now() + config_.heartbeat_interval;
  auto next_cleanup = clock::now() + config_.cleanup_interval;

  std::unique_lock<std::mutex> lock(sweep_mtx_);
  while (running_.load()) {
    auto deadline = std::min(next_heartbeat, next_cleanup);
    sweep_cv_.wait_until(lock, deadline, [this] { return !running_.load(); });
    if (!running_.load()) break;

    auto now = clock::now();
    if (now >= next_heartbeat) {
      dispatcher_.enqueue([this] { hub_.liveness_sweep(); });
      next_heartbeat = now + config_.heartbeat_interval;
    }
    if (now >= next_cleanup) {
      dispatcher_.enqueue([this] { hub_.retention_sweep(); });
      next_cleanup = now + config_.cleanup_interval;
    }
  }
}

void Server::on_frame(const std::shared_ptr<Connection>& conn, std::vector<std::uint8_t> frame) {
  switch (frame_kind(frame)) {
    case FrameKind::Pong:
      dispatcher_.enqueue([this, conn] { hub_.on_pong(conn->id()); });
      return;
    case FrameKind::Ping:
      // Hub probes, clients answer; a client-initiated probe needs no reply.
      return;
    case FrameKind::Close:
      conn->close();
      return;
    case FrameKind::Text:
      break;
  }

  Message msg;
  std::string error;
  if (!decode_frame(frame, msg, error)) {
    dispatcher_.enqueue([this, conn, error] { hub_.on_malformed(conn->id(), error); });
    return;
  }
  dispatcher_.enqueue([this, conn, msg = std::move(msg)] { hub_.on_message(conn->id(), msg); });
}

void Server::on_connection_closed(const std::shared_ptr<Connection>& conn) {
  dispatcher_.enqueue([this, conn] { hub_.on_close(conn->id()); });
  std::lock_guard<std::mutex> lock(conns_mtx_);
  connections_.erase(std::remove(connections_.begin(), connections_.end(), conn),
                     connections_.end());
}

void Server::close_all_connections() {
  std::vector<std::shared_ptr<Connection>> to_close;
  {
    std::lock_guard<std::mutex> lock(conns_mtx_);
    to_close.swap(connections_);
  }
  for (auto& c : to_close) {
    if (c) c->stop();
  }
}

Connection::Connection(int fd, Server* server, std::string peer)
    : fd_(fd), server_(server), peer_(std::move(peer)) {}

Connection::~Connection() {
  stop();
}

void Connection::start() {
  reader_ = std::thread(&Connection::read_loop, this);
  writer_ = std::thread(&Connection::write_loop, this);
}

void Connection::stop() {
  if (!alive_.exchange(false)) return;
  close();
  // The writer drains what is queued, then shuts the socket down.
  if (writer_.joinable()) {
    if (writer_.get_id() == std::this_thread::get_id()) {
      writer_.detach();
    } else {
      writer_.join();
    }
  }
  int fd = fd_.load();
  if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
  if (reader_.joinable()) {
    if (reader_.get_id() == std::this_thread::get_id()) {
      reader_.detach();
    } else {
      reader_.join();
    }
  }
  fd = fd_.exchange(-1);
  if (fd >= 0) ::close(fd);
}

void Connection::send(const Message& msg) {
  std::string error;
  auto frame = encode_frame(msg, error);
  if (frame.empty()) {
    spdlog::error("[server] encode error to {}: {}", peer_, error);
    return;
  }
  enqueue_frame(std::move(frame));
}

void Connection::send_ping() {
  enqueue_frame(encode_control_frame(FrameKind::Ping));
}

void Connection::close() {
  {
    std::lock_guard<std::mutex> lock(out_mtx_);
    closing_ = true;
  }
  out_cv_.notify_all();
}

void Connection::terminate() {
  {
    std::lock_guard<std::mutex> lock(out_mtx_);
    closing_ = true;
    outbound_.clear();
  }
  out_cv_.notify_all();
  int fd = fd_.load();
  if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void Connection::enqueue_frame(std::vector<std::uint8_t> frame) {
  {
    std::lock_guard<std::mutex> lock(out_mtx_);
    if (closing_) return;
    if (outbound_.size() >= kMaxPendingFrames) {
      spdlog::warn("[server] outbound queue full for {}, dropping frame", peer_);
      return;
    }
    outbound_.push_back(std::move(frame));
  }
  out_cv_.notify_one();
}

void Connection::write_loop() {
  while (true) {
    std::vector<std::uint8_t> frame;
    {
      std::unique_lock<std::mutex> lock(out_mtx_);
      out_cv_.wait(lock, [this] { return closing_ || !outbound_.empty(); });
      if (outbound_.empty()) break;
      frame = std::move(outbound_.front());
      outbound_.pop_front();
    }
    std::string error;
    if (!write_frame(fd_, frame, error)) {
      spdlog::warn("[server] send error to {}: {}", peer_, error);
      std::lock_guard<std::mutex> lock(out_mtx_);
      closing_ = true;
      outbound_.clear();
      break;
    }
  }
  ::shutdown(fd_, SHUT_RDWR);
}

void Connection::read_loop() {
  auto self = shared_from_this();
  while (true) {
    std::vector<std::uint8_t> frame;
    std::string error;
    if (!read_frame(fd_, frame, error)) {
      if (error != "EOF") {
        spdlog::info("[server] read error from {}: {}", peer_, error);
      }
      break;
    }
    server_->on_frame(self, std::move(frame));
  }
  close();
  server_->on_connection_closed(self);
}

}  // namespace quizsync::server
