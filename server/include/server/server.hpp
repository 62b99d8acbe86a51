#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/message.hpp"
#include "common/thread_pool.hpp"
#include "server/hub.hpp"

namespace quizsync::server {

class Connection;

// TCP front end of the Hub. Accepts connections, runs one reader and one
// writer thread per connection and funnels every Hub call through a
// single-worker dispatcher, so the Hub sees one mutator thread.
class Server {
 public:
  explicit Server(HubConfig config);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  bool start(std::string* error = nullptr);
  void stop();

  // Bound port; differs from the configured one when that was 0.
  std::uint16_t port() const { return bound_port_; }
  const HubConfig& config() const { return config_; }

  // Runs `fn` against the Hub on the dispatcher and waits for it.
  void with_hub(const std::function<void(Hub&)>& fn);

  // Called from connection threads.
  void on_frame(const std::shared_ptr<Connection>& conn, std::vector<std::uint8_t> frame);
  void on_connection_closed(const std::shared_ptr<Connection>& conn);

 private:
  void accept_loop();
  void sweep_loop();
  void close_all_connections();

  HubConfig config_;
  std::atomic<bool> running_{false};
  int listen_fd_{-1};
  std::uint16_t bound_port_{0};
  std::thread accept_thread_;
  std::thread sweep_thread_;
  std::mutex sweep_mtx_;
  std::condition_variable sweep_cv_;

  std::mutex conns_mtx_;
  std::vector<std::shared_ptr<Connection>> connections_;

  Hub hub_;
  ThreadPool dispatcher_{1};
};

class Connection : public Peer, public std::enable_shared_from_this<Connection> {
 public:
  static constexpr std::size_t kMaxPendingFrames = 1024;

  Connection(int fd, Server* server, std::string peer);
  ~Connection() override;

  void start();
  void stop();

  void send(const quizsync::Message& msg) override;
  void send_ping() override;
  void close() override;
  void terminate() override;
  std::string address() const override { return peer_; }

  // Assigned by the Hub on accept; read and written on the dispatcher only.
  const std::string& id() const { return id_; }
  void set_id(std::string id) { id_ = std::move(id); }

 private:
  void read_loop();
  void write_loop();
  void enqueue_frame(std::vector<std::uint8_t> frame);
  void join_threads();

  std::atomic<int> fd_;
  Server* server_;
  std::string peer_;
  std::string id_;
  std::atomic<bool> alive_{true};
  std::thread reader_;
  std::thread writer_;

  std::mutex out_mtx_;
  std::condition_variable out_cv_;
  std::deque<std::vector<std::uint8_t>> outbound_;
  bool closing_{false};
};

}  // namespace quizsync::server
