#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "common/protocol.hpp"
#include "server/hub.hpp"

using quizsync::Message;
using quizsync::MessageType;
using quizsync::server::Hub;

namespace {

struct TestRunner {
  int failures{0};

  void expect(bool condition, const std::string& msg) {
    if (!condition) {
      ++failures;
      std::cerr << "[FAIL] " << msg << "\n";
    }
  }

  int exit_code() const {
    if (failures == 0) {
      std::cout << "[PASS] all hub tests\n";
      return 0;
    }
    std::cerr << "[FAILURES] total: " << failures << "\n";
    return 1;
  }
};

// Records everything the hub sends; close/terminate are only noted, the test
// delivers on_close itself the way the transport would.
class FakePeer : public quizsync::server::Peer {
 public:
  explicit FakePeer(std::string name) : name_(std::move(name)) {}

  void send(const Message& msg) override { sent.push_back(msg); }
  void send_ping() override { ++pings; }
  void close() override { closed = true; }
  void terminate() override { terminated = true; }
  std::string address() const override { return name_; }

  std::vector<Message> of_type(const std::string& type) const {
    std::vector<Message> out;
    for (const auto& m : sent) {
      if (m.type == type) out.push_back(m);
    }
    return out;
  }

  const Message* last() const { return sent.empty() ? nullptr : &sent.back(); }
  void clear() { sent.clear(); }

  std::vector<Message> sent;
  int pings{0};
  bool closed{false};
  bool terminated{false};

 private:
  std::string name_;
};

struct Harness {
  std::uint64_t now{1'000'000};
  Hub hub{std::chrono::milliseconds(3600000), [this] { return now; }};

  std::pair<std::string, std::shared_ptr<FakePeer>> connect(const std::string& name) {
    auto peer = std::make_shared<FakePeer>(name);
    std::string id = hub.on_accept(peer);
    return {id, peer};
  }
};

Message identify(const std::string& user, const std::string& name) {
  return quizsync::make_identify(user, name);
}

Message submit(const std::string& q, const std::string& answer, const std::string& user,
               std::uint64_t ts) {
  quizsync::Response r;
  r.question_id = q;
  r.answer = answer;
  r.user_id = user;
  r.display_name = user;
  r.timestamp = ts;
  return quizsync::make_submit_response(r);
}

}  // namespace

int main() {
  TestRunner tr;

  // Accept sends welcome; no bulk_update while the session is empty.
  {
    Harness h;
    auto [id, peer] = h.connect("a");
    tr.expect(id.rfind("client_", 0) == 0, "connection id prefix");
    tr.expect(peer->sent.size() == 1 && peer->sent[0].type == "welcome", "welcome only");
    tr.expect(peer->sent[0].data["id"] == id, "welcome carries id");
    tr.expect(peer->sent[0].data["serverTime"] == h.now, "welcome carries server time");
    tr.expect(peer->sent[0].data["activeUserCount"] == 0, "welcome carries user count");
    tr.expect(h.hub.connection_count() == 1, "connection registered");
    auto info = h.hub.connection(id);
    tr.expect(info && info->is_alive, "new connection is alive");
  }

  // Late joiner gets the proactive bulk_update without asking.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    h.hub.on_message(a, submit("Q1", "B", "u1", 10));
    h.hub.on_message(a, submit("Q2", "A", "u1", 11));
    auto [b, pb] = h.connect("b");
    tr.expect(pb->sent.size() == 2, "welcome plus bulk_update");
    tr.expect(pb->sent[1].type == "bulk_update", "bulk_update second");
    tr.expect(pb->sent[1].data["responses"].size() == 2, "bulk_update has all responses");
  }

  // identify: user_joined to others only, identified to sender only.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    auto [b, pb] = h.connect("b");
    pa->clear();
    pb->clear();
    h.hub.on_message(a, identify("u1", "Ada"));
    tr.expect(h.hub.is_active("u1"), "user active after identify");
    tr.expect(pa->of_type("user_joined").empty(), "sender excluded from user_joined");
    auto ident = pa->of_type("identified");
    tr.expect(ident.size() == 1 && ident[0].data["success"] == true, "identified reply");
    tr.expect(ident.size() == 1 && ident[0].data["activeUsers"].size() == 1,
              "identified lists active users");
    auto joined = pb->of_type("user_joined");
    tr.expect(joined.size() == 1 && joined[0].data["userId"] == "u1" &&
                  joined[0].data["activeUsers"] == 1,
              "others see user_joined");
    tr.expect(pb->of_type("identified").empty(), "identified not broadcast");
  }

  // identify without userId is rejected; display name defaults.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    pa->clear();
    h.hub.on_message(a, quizsync::make_message(MessageType::Identify));
    tr.expect(pa->last() && pa->last()->type == "error", "identify without userId errors");
    h.hub.on_message(a, quizsync::make_message(MessageType::Identify, {{"userId", "u9"}}));
    auto info = h.hub.connection(a);
    tr.expect(info && info->display_name == "Anonymous", "display name defaults");
  }

  // submit: overwrite unconditionally, peer_response to others, confirm to sender.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    auto [b, pb] = h.connect("b");
    auto [c, pc] = h.connect("c");
    pa->clear();
    pb->clear();
    pc->clear();

    h.hub.on_message(a, submit("Q1", "B", "u1", 100));
    h.hub.on_message(a, submit("Q1", "C", "u1", 50));
    auto stored = h.hub.find_response("Q1", "u1");
    tr.expect(stored && stored->answer == "C", "hub keeps last applied write despite timestamp");
    tr.expect(h.hub.response_count() == 1, "one entry per (question, user)");

    tr.expect(pa->of_type("peer_response").empty(), "sender excluded from peer_response");
    auto confirms = pa->of_type("response_confirmed");
    tr.expect(confirms.size() == 2 && confirms[0].data["questionId"] == "Q1" &&
                  confirms[0].data["success"] == true,
              "sender receives confirmations");
    auto seen_b = pb->of_type("peer_response");
    auto seen_c = pc->of_type("peer_response");
    tr.expect(seen_b.size() == 2 && seen_c.size() == 2, "others receive peer_response");
    tr.expect(!seen_b.empty() && seen_b.back().data["answer"] == "C", "peer_response payload");
    tr.expect(pb->of_type("response_confirmed").empty(), "confirmation not broadcast");
  }

  // submit without timestamp gets the hub's receipt time.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    h.now = 5'000'000;
    h.hub.on_message(a, quizsync::make_message(
                            MessageType::SubmitResponse,
                            {{"questionId", "Q7"}, {"userId", "u1"}, {"answer", "D"}}));
    auto stored = h.hub.find_response("Q7", "u1");
    tr.expect(stored && stored->timestamp == 5'000'000, "timestamp defaults to receipt time");
  }

  // submit missing required fields is rejected and not stored.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    auto [b, pb] = h.connect("b");
    pa->clear();
    pb->clear();
    h.hub.on_message(a, quizsync::make_message(MessageType::SubmitResponse,
                                               {{"questionId", "Q1"}, {"answer", "A"}}));
    tr.expect(h.hub.response_count() == 0, "invalid submit not stored");
    tr.expect(pa->last() && pa->last()->type == "error", "invalid submit answered with error");
    tr.expect(pb->sent.empty(), "invalid submit not broadcast");
  }

  // request_sync is idempotent and only answers the sender.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    auto [b, pb] = h.connect("b");
    h.hub.on_message(a, identify("u1", "Ada"));
    h.hub.on_message(a, submit("Q1", "B", "u1", 10));
    pa->clear();
    pb->clear();
    h.hub.on_message(a, quizsync::make_request_sync());
    h.hub.on_message(a, quizsync::make_request_sync());
    auto syncs = pa->of_type("sync_response");
    tr.expect(syncs.size() == 2, "two sync responses");
    if (syncs.size() == 2) {
      tr.expect(syncs[0].data["responses"] == syncs[1].data["responses"],
                "sync content identical without writes");
      tr.expect(syncs[0].data["activeUsers"] == syncs[1].data["activeUsers"],
                "active users identical without writes");
      tr.expect(syncs[0].data["activeUsers"].size() == 1, "sync lists active users");
    }
    tr.expect(pb->sent.empty(), "sync not broadcast");
  }

  // ping and get_stats.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    h.hub.on_message(a, identify("u1", "Ada"));
    h.hub.on_message(a, submit("Q1", "B", "u1", 10));
    h.now += 2500;
    pa->clear();
    h.hub.on_message(a, quizsync::make_ping());
    tr.expect(pa->last() && pa->last()->type == "pong" && pa->last()->data["timestamp"] == h.now,
              "pong carries timestamp");
    h.hub.on_message(a, quizsync::make_get_stats());
    const Message* stats = pa->last();
    tr.expect(stats && stats->type == "stats", "stats reply");
    if (stats) {
      tr.expect(stats->data["connectedClients"] == 1, "stats connected clients");
      tr.expect(stats->data["activeUsers"] == 1, "stats active users");
      tr.expect(stats->data["totalResponses"] == 1, "stats total responses");
      tr.expect(stats->data["totalConnections"] == 1, "stats total connections");
      tr.expect(stats->data["uptime"] == 2500, "stats uptime");
    }
  }

  // Unknown type: error to sender only, connection kept.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    auto [b, pb] = h.connect("b");
    pa->clear();
    pb->clear();
    h.hub.on_message(a, Message{"mystery", nlohmann::json::object()});
    tr.expect(pa->last() && pa->last()->type == "error" &&
                  pa->last()->data["message"] == "Unknown message type: mystery",
              "unknown type answered with error");
    tr.expect(pb->sent.empty(), "unknown type not broadcast");
    tr.expect(h.hub.connection_count() == 2 && !pa->terminated && !pa->closed,
              "connection survives unknown type");
    h.hub.on_malformed(a, "JSON parse error");
    tr.expect(pa->last() && pa->last()->data["message"] == "Invalid message format",
              "malformed payload answered with error");
  }

  // Close: user removed, user_disconnected to the rest, responses retained.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    auto [b, pb] = h.connect("b");
    h.hub.on_message(a, identify("u1", "Ada"));
    h.hub.on_message(a, submit("Q1", "B", "u1", 10));
    pb->clear();
    h.hub.on_close(a);
    tr.expect(!h.hub.is_active("u1"), "closed user inactive");
    tr.expect(h.hub.connection_count() == 1, "connection entry removed");
    auto gone = pb->of_type("user_disconnected");
    tr.expect(gone.size() == 1 && gone[0].data["userId"] == "u1" &&
                  gone[0].data["displayName"] == "Ada" && gone[0].data["activeUsers"] == 0,
              "others see user_disconnected");
    tr.expect(h.hub.find_response("Q1", "u1").has_value(), "responses outlive the socket");
    pb->clear();
    h.hub.on_message(b, quizsync::make_request_sync());
    tr.expect(pb->last() && pb->last()->data["responses"].size() == 1,
              "closed user's responses still synced");
  }

  // Closing an anonymous connection broadcasts nothing.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    auto [b, pb] = h.connect("b");
    pb->clear();
    h.hub.on_close(a);
    tr.expect(pb->sent.empty(), "anonymous close is silent");
  }

  // Liveness: silent connection terminated on the second sweep; others notified.
  {
    Harness h;
    auto [c1, p1] = h.connect("1");
    auto [c2, p2] = h.connect("2");
    auto [c3, p3] = h.connect("3");
    h.hub.on_message(c1, identify("u1", "One"));
    h.hub.on_message(c2, identify("u2", "Two"));
    h.hub.on_message(c3, identify("u3", "Three"));

    tr.expect(h.hub.liveness_sweep() == 0, "first sweep terminates nobody");
    tr.expect(p1->pings == 1 && p2->pings == 1 && p3->pings == 1, "first sweep pings everyone");
    h.hub.on_pong(c1);
    h.hub.on_pong(c3);

    p1->clear();
    p3->clear();
    tr.expect(h.hub.liveness_sweep() == 1, "second sweep terminates one");
    tr.expect(p2->terminated, "silent connection terminated");
    tr.expect(!p1->terminated && !p3->terminated, "answering connections kept");
    h.hub.on_close(c2);  // transport reports the socket closed
    auto seen1 = p1->of_type("user_disconnected");
    auto seen3 = p3->of_type("user_disconnected");
    tr.expect(seen1.size() == 1 && seen1[0].data["userId"] == "u2", "conn 1 notified");
    tr.expect(seen3.size() == 1 && seen3[0].data["userId"] == "u2", "conn 3 notified");
    tr.expect(p2->of_type("user_disconnected").empty(), "terminated conn not notified");
    tr.expect(!h.hub.is_active("u2") && h.hub.active_user_count() == 2, "active users updated");
  }

  // Retention: entries older than the window disappear, empty questions too.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    h.hub.on_message(a, submit("Q1", "A", "u1", h.now));
    h.hub.on_message(a, submit("Q2", "B", "u1", h.now));
    tr.expect(h.hub.retention_sweep() == 0, "fresh responses retained");

    h.now += 30 * 60 * 1000;
    h.hub.on_message(a, submit("Q2", "C", "u2", h.now));
    h.now += 31 * 60 * 1000;  // first two are now past one hour
    tr.expect(h.hub.retention_sweep() == 2, "old responses removed");
    tr.expect(!h.hub.find_response("Q1", "u1") && !h.hub.find_response("Q2", "u1"),
              "old entries gone");
    tr.expect(h.hub.find_response("Q2", "u2").has_value(), "newer entry kept");

    pa->clear();
    h.hub.on_message(a, quizsync::make_request_sync());
    tr.expect(pa->last() && pa->last()->data["responses"].size() == 1,
              "expired responses absent from sync");
    auto [b, pb] = h.connect("b");
    auto bulk = pb->of_type("bulk_update");
    tr.expect(bulk.size() == 1 && bulk[0].data["responses"].size() == 1,
              "expired responses absent from bulk_update");
  }

  // Shutdown: server_shutdown to everyone, then graceful close.
  {
    Harness h;
    auto [a, pa] = h.connect("a");
    auto [b, pb] = h.connect("b");
    h.hub.shutdown();
    tr.expect(pa->last() && pa->last()->type == "server_shutdown", "a told about shutdown");
    tr.expect(pb->last() && pb->last()->type == "server_shutdown", "b told about shutdown");
    tr.expect(pa->closed && pb->closed, "connections closed");
  }

  // Messages for unknown connections are ignored.
  {
    Harness h;
    h.hub.on_message("client_missing", quizsync::make_ping());
    h.hub.on_close("client_missing");
    tr.expect(h.hub.connection_count() == 0, "unknown connection ignored");
  }

  // Port and period settings reject garbage instead of throwing.
  {
    using quizsync::server::parse_period;
    using quizsync::server::parse_port;
    tr.expect(parse_port("8080") && *parse_port("8080") == 8080, "port parsed");
    tr.expect(!parse_port("abc"), "non-numeric port rejected");
    tr.expect(!parse_port("0") && !parse_port("65536") && !parse_port(""), "port range enforced");
    tr.expect(!parse_port("-1") && !parse_port("80x"), "signs and suffixes rejected");
    tr.expect(parse_period("250") && parse_period("250")->count() == 250, "period parsed");
    tr.expect(!parse_period("0"), "zero period rejected");
    tr.expect(!parse_period("fast") && !parse_period("99999999999999999999"), "bad period rejected");
  }

  return tr.exit_code();
}
