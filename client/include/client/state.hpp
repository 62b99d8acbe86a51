#pragma once

#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include "client/mode_controller.hpp"
#include "common/protocol.hpp"

namespace quizsync::client {

// Notices arrive on controller threads and are drained by the UI loop.
class NoticeInbox {
 public:
  void push(const Notice& notice) {
    std::lock_guard<std::mutex> lock(mtx_);
    pending_.push_back(notice);
  }

  std::vector<Notice> drain() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<Notice> out(pending_.begin(), pending_.end());
    pending_.clear();
    return out;
  }

 private:
  std::mutex mtx_;
  std::deque<Notice> pending_;
};

struct NoticeRow {
  Notice notice;
  std::string time;
};

struct ClientState {
  // Identity
  std::string user_id = "student1";
  std::string display_name = "Student One";

  // Relay
  std::string relay_address = "127.0.0.1:8080";
  std::future<bool> pending_connect;

  // Answer form
  std::string question_id = "Q1";
  std::string answer = "A";
  std::string reason;
  std::string last_submit;

  // Peer view
  std::string watched_question = "Q1";
  std::vector<quizsync::Response> peer_rows;

  // Notices
  NoticeInbox inbox;
  std::vector<NoticeRow> notices;  // newest last, capped
};

}  // namespace quizsync::client
