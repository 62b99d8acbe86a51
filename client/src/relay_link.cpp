#include "client/relay_link.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <set>
#include <variant>

#include <spdlog/spdlog.h>

#include "common/codec.hpp"

namespace quizsync::client {

namespace {

constexpr int kSendTimeoutSeconds = 5;
// Upper bound on one poll() while connecting, so close() is noticed promptly.
constexpr long long kPollSliceMs = 100;

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

int connect_with_deadline(const addrinfo* ai, std::chrono::steady_clock::time_point deadline,
                          const std::atomic<bool>& cancelled, std::string& error) {
  int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
  if (fd < 0) {
    error = std::string("socket: ") + std::strerror(errno);
    return -1;
  }
  int flags = ::fcntl(fd, F_GETFL, 0);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

  if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
    if (errno != EINPROGRESS) {
      error = std::string("connect: ") + std::strerror(errno);
      ::close(fd);
      return -1;
    }
    while (true) {
      if (cancelled.load()) {
        error = "connect cancelled";
        ::close(fd);
        return -1;
      }
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                           deadline - std::chrono::steady_clock::now())
                           .count();
      if (remaining <= 0) {
        error = "connect timed out";
        ::close(fd);
        return -1;
      }
      pollfd pfd{};
      pfd.fd = fd;
      pfd.events = POLLOUT;
      int ready = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, kPollSliceMs)));
      if (ready < 0) {
        if (errno == EINTR) continue;
        error = std::string("poll: ") + std::strerror(errno);
        ::close(fd);
        return -1;
      }
      if (ready == 0) continue;
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
      if (so_error != 0) {
        error = std::string("connect: ") + std::strerror(so_error);
        ::close(fd);
        return -1;
      }
      break;
    }
  }

  ::fcntl(fd, F_SETFL, flags);
  timeval tv{};
  tv.tv_sec = kSendTimeoutSeconds;
  ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  return fd;
}

}  // namespace

bool parse_relay_address(const std::string& address, std::string& host, std::uint16_t& port,
                         std::string& error) {
  auto colon = address.rfind(':');
  host = address.substr(0, colon);
  port = kDefaultHubPort;
  if (colon != std::string::npos) {
    std::string digits = address.substr(colon + 1);
    if (digits.empty() || digits.size() > 5 ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
      error = "invalid port in address: " + address;
      return false;
    }
    unsigned long value = std::stoul(digits);
    if (value == 0 || value > 65535) {
      error = "invalid port in address: " + address;
      return false;
    }
    port = static_cast<std::uint16_t>(value);
  }
  if (host.empty()) {
    error = "missing host in address: " + address;
    return false;
  }
  return true;
}

const char* to_string(RelayLink::State state) {
  switch (state) {
    case RelayLink::State::Connecting:
      return "connecting";
    case RelayLink::State::Open:
      return "open";
    case RelayLink::State::Closed:
      return "closed";
  }
  return "unknown";
}

RelayLink::RelayLink(LocalCache& cache, Listener* listener) : cache_(cache), listener_(listener) {}

RelayLink::~RelayLink() {
  close();
  join_io();
}

std::future<bool> RelayLink::connect(const std::string& address, std::optional<Identity> identity,
                                     std::chrono::milliseconds timeout) {
  auto ready = std::make_shared<std::promise<bool>>();
  auto result = ready->get_future();

  State expected = State::Closed;
  if (!state_.compare_exchange_strong(expected, State::Connecting)) {
    set_error("link is already connecting or open");
    ready->set_value(false);
    return result;
  }
  join_io();
  closing_.store(false);
  {
    std::lock_guard<std::mutex> lock(info_mtx_);
    address_ = address;
    client_id_.clear();
    last_error_.clear();
  }
  io_thread_ = std::thread(&RelayLink::run, this, address, std::move(identity), timeout, ready);
  return result;
}

void RelayLink::run(std::string address, std::optional<Identity> identity,
                    std::chrono::milliseconds timeout, std::shared_ptr<std::promise<bool>> ready) {
  auto fail = [&](const std::string& error) {
    set_error(error);
    state_.store(State::Closed);
    int fd = fd_.load();
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
    spdlog::warn("[relay] connect to {} failed: {}", address, error);
    ready->set_value(false);
  };

  std::string host;
  std::uint16_t port = kDefaultHubPort;
  std::string error;
  if (!parse_relay_address(address, host, port, error)) {
    fail(error);
    return;
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  int fd = open_socket(host, port, deadline, error);
  if (fd < 0) {
    fail(error);
    return;
  }
  fd_.store(fd);

  State expected = State::Connecting;
  if (!state_.compare_exchange_strong(expected, State::Open)) {
    fail("connect cancelled");
    return;
  }

  bool ok = true;
  if (identity) {
    ok = send(make_identify(identity->user_id, identity->display_name), &error);
  }
  if (ok) ok = send(make_request_sync(), &error);
  if (!ok) {
    fail(error);
    return;
  }

  spdlog::info("[relay] connected to {}", address);
  ready->set_value(true);
  read_loop();
}

int RelayLink::open_socket(const std::string& host, std::uint16_t port,
                           std::chrono::steady_clock::time_point deadline, std::string& error) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    error = "resolve " + host + ": " + ::gai_strerror(rc);
    return -1;
  }
  int fd = -1;
  for (const addrinfo* ai = results; ai && fd < 0; ai = ai->ai_next) {
    fd = connect_with_deadline(ai, deadline, closing_, error);
  }
  ::freeaddrinfo(results);
  return fd;
}

void RelayLink::read_loop() {
  while (true) {
    std::vector<std::uint8_t> frame;
    std::string error;
    if (!read_frame(fd_, frame, error)) {
      if (!closing_.load() && error != "EOF") {
        spdlog::warn("[relay] read error: {}", error);
      }
      break;
    }

    FrameKind kind = frame_kind(frame);
    if (kind == FrameKind::Close) break;
    if (kind == FrameKind::Ping) {
      std::lock_guard<std::mutex> lock(write_mtx_);
      write_locked(encode_control_frame(FrameKind::Pong), nullptr);
      continue;
    }
    if (kind == FrameKind::Pong) continue;

    Message msg;
    if (!decode_frame(frame, msg, error)) {
      spdlog::warn("[relay] dropping undecodable frame: {}", error);
      continue;
    }
    handle_message(msg);
  }

  bool intentional = closing_.exchange(true);
  state_.store(State::Closed);
  int fd = fd_.load();
  if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
  if (!intentional) {
    spdlog::warn("[relay] link to {} closed by peer", address());
    if (listener_) listener_->on_link_closed(*this);
  }
}

bool RelayLink::send(const Message& msg, std::string* error) {
  if (state_.load() != State::Open) {
    if (error) *error = "relay link is not open";
    return false;
  }
  std::string err;
  auto frame = encode_frame(msg, err);
  if (frame.empty()) {
    if (error) *error = err;
    return false;
  }
  std::lock_guard<std::mutex> lock(write_mtx_);
  return write_locked(frame, error);
}

bool RelayLink::submit_response(const Response& r, std::string* error) {
  return send(make_submit_response(r), error);
}

bool RelayLink::write_locked(const std::vector<std::uint8_t>& frame, std::string* error) {
  int fd = fd_.load();
  if (fd < 0) {
    if (error) *error = "relay link is not open";
    return false;
  }
  std::string err;
  if (!write_frame(fd, frame, err)) {
    if (error) *error = err;
    return false;
  }
  return true;
}

void RelayLink::close() {
  closing_.store(true);
  State previous = state_.exchange(State::Closed);
  int fd = fd_.load();
  if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
  if (previous == State::Open) {
    spdlog::info("[relay] closed link to {}", address());
  }
}

void RelayLink::join_io() {
  if (io_thread_.joinable()) {
    if (io_thread_.get_id() == std::this_thread::get_id()) {
      io_thread_.detach();
    } else {
      io_thread_.join();
    }
  }
  int fd = fd_.exchange(-1);
  if (fd >= 0) ::close(fd);
}

void RelayLink::handle_message(const Message& msg) {
  std::string error;
  auto event = decode_hub_event(msg, error);
  if (!event) {
    spdlog::warn("[relay] dropping '{}' message: {}", msg.type, error);
    return;
  }

  std::visit(overloaded{
                 [this](const Welcome& e) {
                   {
                     std::lock_guard<std::mutex> lock(info_mtx_);
                     client_id_ = e.id;
                   }
                   active_users_.store(e.active_user_count);
                   spdlog::info("[relay] welcome as {} ({} active users)", e.id,
                                e.active_user_count);
                 },
                 [this](const Identified& e) {
                   active_users_.store(e.active_users.size());
                   spdlog::info("[relay] identified: {}", e.success);
                 },
                 [this](const PeerResponse& e) { fold_responses({e.response}); },
                 [this](const BulkUpdate& e) {
                   spdlog::info("[relay] bulk update with {} responses", e.responses.size());
                   fold_responses(e.responses);
                 },
                 [this](const SyncResponse& e) {
                   spdlog::info("[relay] sync: {} responses, {} active users",
                                e.responses.size(), e.active_users.size());
                   active_users_.store(e.active_users.size());
                   fold_responses(e.responses);
                 },
                 [this](const UserJoined& e) {
                   active_users_.store(e.active_users);
                   spdlog::info("[relay] {} joined ({} active)", e.display_name, e.active_users);
                 },
                 [this](const UserDisconnected& e) {
                   active_users_.store(e.active_users);
                   spdlog::info("[relay] {} left ({} active)", e.display_name, e.active_users);
                 },
                 [](const ResponseConfirmed& e) {
                   spdlog::debug("[relay] response to {} confirmed", e.question_id);
                 },
                 [](const Pong& e) { spdlog::debug("[relay] pong at {}", e.timestamp); },
                 [](const Stats& e) {
                   spdlog::info("[relay] stats: {} clients, {} users, {} responses",
                                e.connected_clients, e.active_users, e.total_responses);
                 },
                 [](const ErrorNotice& e) { spdlog::warn("[relay] hub error: {}", e.message); },
                 [](const ServerShutdown& e) {
                   spdlog::info("[relay] hub shutting down: {}", e.message);
                 },
             },
             *event);
}

void RelayLink::fold_responses(const std::vector<Response>& responses) {
  std::set<std::string> touched;
  for (const auto& r : responses) {
    cache_.put_peer(r);
    touched.insert(r.question_id);
  }
  if (!listener_) return;
  for (const auto& question_id : touched) listener_->on_peer_data(question_id);
}

std::string RelayLink::address() const {
  std::lock_guard<std::mutex> lock(info_mtx_);
  return address_;
}

std::string RelayLink::client_id() const {
  std::lock_guard<std::mutex> lock(info_mtx_);
  return client_id_;
}

std::string RelayLink::last_error() const {
  std::lock_guard<std::mutex> lock(info_mtx_);
  return last_error_;
}

void RelayLink::set_error(const std::string& error) {
  std::lock_guard<std::mutex> lock(info_mtx_);
  last_error_ = error;
}

}  // namespace quizsync::client
