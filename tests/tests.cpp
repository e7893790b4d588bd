#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fake_transport.hpp"
#include "maimwire/backoff.hpp"
#include "maimwire/client.hpp"
#include "maimwire/config.hpp"
#include "maimwire/connection.hpp"
#include "maimwire/message.hpp"
#include "maimwire/outbox.hpp"
#include "maimwire/router.hpp"
#include "maimwire/server.hpp"

using namespace maimwire;
using maimwire::testing::FakeTransport;
using maimwire::testing::FakeWire;
using maimwire::testing::fake_factory;

static int fail(const std::string& msg, const char* file, int line) {
  std::cerr << "TEST FAIL: " << msg << " (" << file << ":" << line << ")\n";
  return 1;
}

#define EXPECT_TRUE(x)         \
  do {                         \
    if (!(x)) {                \
      return fail(#x, __FILE__, __LINE__); \
    }                          \
  } while (0)

#define EXPECT_EQ(a, b)                                              \
  do {                                                               \
    const auto _a = (a);                                             \
    const auto _b = (b);                                             \
    if (!(_a == _b)) {                                               \
      std::ostringstream ss;                                         \
      ss << #a << " == " << #b << " (got '" << _a << "' vs '" << _b << "')"; \
      return fail(ss.str(), __FILE__, __LINE__);                     \
    }                                                                \
  } while (0)

template <typename E, typename F>
static bool throws(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

template <typename Pred>
static bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return pred();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

static ConnectionOptions fast_options() {
  ConnectionOptions o;
  o.poll_interval_ms = 5;
  o.drain_timeout_ms = 300;
  o.handshake_timeout_ms = 2000;
  return o;
}

static Message text_message(const std::string& platform, const std::string& text) {
  return make_message(platform, std::int64_t{10001}, Seg::text(text));
}

static int test_message_model() {
  {
    Message m = make_message("qq", std::int64_t{123456}, Seg::list({
                                                              Seg::text("hello "),
                                                              Seg::list({Seg::image("aGVsbG8="),
                                                                         Seg::list({Seg::at("654321"), Seg::text("!")})}),
                                                          }));
    m.info.message_id = std::int64_t{42};
    m.info.time = 1700000000.25;
    m.info.user_info.nickname = "alice";
    m.info.group_info = GroupInfo{"qq", std::string("g-100"), std::string("devs")};
    m.info.format_info = FormatInfo{collect_kinds(m.content), {"text", "image", "emoji"}};
    m.info.template_info = TemplateInfo{{{"reply", "{name} says"}}, std::string("default"), false};
    m.info.additional_config = json{{"maimcore_reply_probability_gain", 0.5}};
    m.raw_text = "hello @654321!";

    const std::string wire = encode(m);
    const Message back = decode(wire);
    EXPECT_TRUE(back == m);
    EXPECT_EQ(back.content.items().size(), static_cast<std::size_t>(2));
    EXPECT_EQ(back.content.items()[1].items()[1].items()[0].payload(), "654321");
    EXPECT_EQ(plain_text(back.content), "hello !");

    const auto kinds = collect_kinds(m.content);
    EXPECT_EQ(kinds.size(), static_cast<std::size_t>(3));
    EXPECT_EQ(kinds[0], "text");
    EXPECT_EQ(kinds[1], "image");
    EXPECT_EQ(kinds[2], "at");
  }

  {
    const Message m = decode(
        R"({"message_info":{"platform":"qq","message_id":9,"time":1.5,"extra_field":true,)"
        R"("user_info":{"platform":"qq","user_id":"u-1"},"group_info":{"group_id":7788}},)"
        R"("message_segment":{"type":"sticker","data":"abc"},"unknown":1})");
    EXPECT_EQ(m.info.platform, "qq");
    EXPECT_TRUE(m.info.message_id.has_value());
    EXPECT_TRUE(std::holds_alternative<std::int64_t>(*m.info.message_id));
    EXPECT_TRUE(std::holds_alternative<std::string>(m.info.user_info.user_id));
    EXPECT_EQ(to_string(m.info.user_info.user_id), "u-1");
    EXPECT_TRUE(m.info.group_info.has_value());
    EXPECT_EQ(m.info.group_info->platform, "qq");
    EXPECT_TRUE(std::holds_alternative<std::int64_t>(m.info.group_info->group_id));
    EXPECT_TRUE(!m.info.format_info.has_value());
    EXPECT_TRUE(!m.raw_text.has_value());
    EXPECT_EQ(m.content.type, "sticker");
    EXPECT_EQ(m.content.payload(), "abc");

    const json j = serialize(m);
    EXPECT_TRUE(j["message_info"]["user_info"]["user_id"].is_string());
    EXPECT_TRUE(j["message_info"]["group_info"]["group_id"].is_number_integer());
    EXPECT_TRUE(!j["message_info"].contains("extra_field"));
    EXPECT_TRUE(!j["message_info"].contains("format_info"));
    EXPECT_TRUE(!j["message_info"].contains("template_info"));
    EXPECT_TRUE(!j.contains("raw_message"));
  }

  {
    const Message m = decode(
        R"({"message_info":{"platform":"qq","user_info":{"platform":"qq","user_id":1},"group_info":null},)"
        R"("message_segment":{"type":"text","data":"x"},"raw_message":null})");
    EXPECT_TRUE(!m.info.group_info.has_value());
    EXPECT_TRUE(!m.raw_text.has_value());
  }

  {
    const Message m = decode(
        R"({"message_info":{"platform":"qq","message_id":18446744073709551615,)"
        R"("user_info":{"platform":"qq","user_id":9223372036854775807}},)"
        R"("message_segment":{"type":"text","data":"x"}})");
    EXPECT_TRUE(std::holds_alternative<std::string>(*m.info.message_id));
    EXPECT_EQ(to_string(*m.info.message_id), "18446744073709551615");
    EXPECT_TRUE(std::holds_alternative<std::int64_t>(m.info.user_info.user_id));
    EXPECT_EQ(std::get<std::int64_t>(m.info.user_info.user_id), std::int64_t{9223372036854775807});
    const std::string wire = encode(m);
    EXPECT_TRUE(wire.find("18446744073709551615") != std::string::npos);
    EXPECT_TRUE(wire.find("-1") == std::string::npos);
  }

  {
    Message m = text_message("qq", "extra");
    m.info.additional_config = json::array({1, "two"});
    EXPECT_TRUE(decode(encode(m)) == m);
    m.info.additional_config = json(7);
    EXPECT_TRUE(decode(encode(m)) == m);
    m.info.additional_config = json(nullptr);
    EXPECT_TRUE(!serialize(m)["message_info"].contains("additional_config"));
    EXPECT_TRUE(!decode(encode(m)).info.additional_config.has_value());
  }

  EXPECT_TRUE(throws<MalformedMessage>([]() {
    decode(R"({"message_info":{"platform":"qq","user_info":{"platform":"qq"}},"message_segment":{"type":"text","data":"x"}})");
  }));
  EXPECT_TRUE(throws<MalformedMessage>([]() {
    decode(R"({"message_info":{"platform":"qq","user_info":{"platform":"qq","user_id":1}},)"
           R"("message_segment":{"type":"seglist","data":"oops"}})");
  }));
  EXPECT_TRUE(throws<MalformedMessage>([]() {
    decode(R"({"message_segment":{"type":"text","data":"x"}})");
  }));
  EXPECT_TRUE(throws<MalformedMessage>([]() { decode("not json at all"); }));
  return 0;
}

static int test_backoff_and_outbox() {
  {
    ExponentialBackoff b(BackoffConfig{10, 40, 2.0});
    EXPECT_EQ(b.next().count(), 10);
    EXPECT_EQ(b.next().count(), 20);
    EXPECT_EQ(b.next().count(), 40);
    EXPECT_EQ(b.next().count(), 40);
    EXPECT_EQ(b.attempts(), 4);
    b.reset();
    EXPECT_EQ(b.next().count(), 10);
  }

  {
    Outbox<int> box("box", 2);
    EXPECT_TRUE(!box.push(1));
    EXPECT_TRUE(!box.push(2));
    EXPECT_TRUE(box.push(3));
    EXPECT_EQ(box.size(), static_cast<std::size_t>(2));
    EXPECT_EQ(*box.try_pop(), 2);
    EXPECT_EQ(*box.try_pop(), 3);
    EXPECT_TRUE(!box.try_pop().has_value());
    box.close();
    EXPECT_TRUE(throws<ConnectionClosed>([&]() { box.push(4); }));
  }

  {
    Outbox<int> box("requeue", 1);
    EXPECT_TRUE(!box.push(1));
    EXPECT_TRUE(!box.push_front(0));
    EXPECT_EQ(box.size(), static_cast<std::size_t>(1));
    EXPECT_EQ(*box.try_pop(), 1);
    EXPECT_TRUE(box.push_front(0));
    EXPECT_EQ(*box.try_pop(), 0);
  }
  return 0;
}

static int test_state_machine() {
  using S = ConnectionState;
  const auto client = ConnectionRole::kClient;
  const auto server = ConnectionRole::kServer;

  EXPECT_TRUE(transition_allowed(S::kDisconnected, S::kConnecting, client));
  EXPECT_TRUE(transition_allowed(S::kConnecting, S::kOpen, server));
  EXPECT_TRUE(transition_allowed(S::kOpen, S::kClosing, server));
  EXPECT_TRUE(transition_allowed(S::kClosing, S::kDisconnected, client));
  EXPECT_TRUE(transition_allowed(S::kOpen, S::kReconnecting, client));
  EXPECT_TRUE(transition_allowed(S::kReconnecting, S::kConnecting, client));
  EXPECT_TRUE(!transition_allowed(S::kOpen, S::kReconnecting, server));
  EXPECT_TRUE(!transition_allowed(S::kDisconnected, S::kOpen, client));
  EXPECT_TRUE(!transition_allowed(S::kClosing, S::kOpen, client));
  EXPECT_EQ(std::string(to_string(S::kReconnecting)), "RECONNECTING");
  return 0;
}

static int test_connection_session() {
  {
    auto wire = std::make_shared<FakeWire>();
    FakeTransport transport(wire);
    Connection conn("c-order", ConnectionRole::kClient, fast_options());

    std::mutex mu;
    std::vector<std::string> received;
    conn.set_message_handler([&](const Message& m) {
      std::lock_guard<std::mutex> lock(mu);
      received.push_back(plain_text(m.content));
    });

    Connection::SessionEnd end = Connection::SessionEnd::kLost;
    std::thread session([&]() { end = conn.run_session(transport); });
    EXPECT_TRUE(conn.wait_for_state(ConnectionState::kOpen, std::chrono::milliseconds(2000)));

    conn.send(text_message("qq", "m1"));
    conn.send(text_message("qq", "m2"));
    conn.send(text_message("qq", "m3"));
    EXPECT_TRUE(wire->wait_sent(3, std::chrono::milliseconds(2000)));
    const auto sent = wire->sent_copy();
    EXPECT_EQ(plain_text(decode(sent[0]).content), "m1");
    EXPECT_EQ(plain_text(decode(sent[1]).content), "m2");
    EXPECT_EQ(plain_text(decode(sent[2]).content), "m3");

    const auto malformed_before = metrics().get(counter::kFramesMalformed);
    wire->push_text("{\"message_info\": 7");
    wire->push_text(encode(text_message("qq", "after")));
    EXPECT_TRUE(wait_until([&]() {
      std::lock_guard<std::mutex> lock(mu);
      return received.size() == 1;
    }));
    EXPECT_EQ(received[0], "after");
    EXPECT_TRUE(metrics().get(counter::kFramesMalformed) > malformed_before);
    EXPECT_TRUE(conn.state() == ConnectionState::kOpen);

    conn.close();
    session.join();
    EXPECT_TRUE(end == Connection::SessionEnd::kStopped);
    EXPECT_TRUE(conn.state() == ConnectionState::kDisconnected);
    EXPECT_TRUE(throws<ConnectionClosed>([&]() { conn.send(text_message("qq", "late")); }));
  }

  {
    auto wire = std::make_shared<FakeWire>();
    wire->auto_pong = false;
    FakeTransport transport(wire);
    ConnectionOptions opts = fast_options();
    opts.heartbeat_interval_ms = 20;
    opts.heartbeat_timeout_ms = 50;
    Connection conn("c-heartbeat", ConnectionRole::kClient, opts);

    const auto end = conn.run_session(transport);
    EXPECT_TRUE(end == Connection::SessionEnd::kLost);
    EXPECT_TRUE(conn.state() == ConnectionState::kReconnecting);
    EXPECT_TRUE(wire->ping_calls >= 1);
    conn.finish();
    EXPECT_TRUE(conn.state() == ConnectionState::kDisconnected);
  }

  {
    auto wire = std::make_shared<FakeWire>();
    FakeTransport transport(wire);
    ConnectionOptions opts = fast_options();
    opts.heartbeat_interval_ms = 10;
    opts.heartbeat_timeout_ms = 200;
    Connection conn("c-pong", ConnectionRole::kClient, opts);

    std::thread session([&]() { conn.run_session(transport); });
    EXPECT_TRUE(conn.wait_for_state(ConnectionState::kOpen, std::chrono::milliseconds(2000)));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_TRUE(conn.state() == ConnectionState::kOpen);
    conn.close();
    session.join();
    EXPECT_TRUE(wire->ping_calls >= 2);
  }

  {
    // Every write to this peer takes 500ms; close() must not wait for the whole queue.
    auto wire = std::make_shared<FakeWire>();
    wire->send_delay_ms = 500;
    FakeTransport transport(wire);
    ConnectionOptions opts = fast_options();
    opts.drain_timeout_ms = 100;
    Connection conn("c-slow-peer", ConnectionRole::kServer, opts);

    Connection::SessionEnd end = Connection::SessionEnd::kLost;
    std::thread session([&]() { end = conn.run_session(transport); });
    EXPECT_TRUE(conn.wait_for_state(ConnectionState::kOpen, std::chrono::milliseconds(2000)));
    for (int i = 0; i < 6; ++i) {
      conn.send(text_message("qq", "slow " + std::to_string(i)));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    const auto started = std::chrono::steady_clock::now();
    conn.close();
    session.join();
    const auto took =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    EXPECT_TRUE(took.count() < 1500);
    EXPECT_TRUE(wire->sent_copy().size() <= static_cast<std::size_t>(2));
    EXPECT_EQ(conn.pending(), static_cast<std::size_t>(0));
    EXPECT_TRUE(end == Connection::SessionEnd::kStopped);
    EXPECT_TRUE(conn.state() == ConnectionState::kDisconnected);
  }

  {
    auto wire = std::make_shared<FakeWire>();
    wire->auto_pong = false;
    FakeTransport transport(wire);
    ConnectionOptions opts = fast_options();
    opts.heartbeat_interval_ms = 20;
    opts.heartbeat_timeout_ms = 50;
    Connection conn("s-heartbeat", ConnectionRole::kServer, opts);

    const auto end = conn.run_session(transport);
    EXPECT_TRUE(end == Connection::SessionEnd::kLost);
    EXPECT_TRUE(conn.state() == ConnectionState::kDisconnected);
    EXPECT_TRUE(throws<ConnectionClosed>([&]() { conn.send(text_message("qq", "too late")); }));
  }
  return 0;
}

static int test_client_endpoint() {
  {
    auto wire = std::make_shared<FakeWire>();
    wire->fail_opens = 2;
    ClientEndpoint client("qq", TargetConfig{"ws://fake/ws", ""}, fast_options(), BackoffConfig{5, 20, 2.0},
                          fake_factory(wire));
    EXPECT_TRUE(!client.send(text_message("qq", "too early")));

    client.start();
    EXPECT_TRUE(client.send(text_message("qq", "queued while down")));
    EXPECT_TRUE(wire->wait_sent(1, std::chrono::milliseconds(3000)));
    EXPECT_EQ(plain_text(decode(wire->sent_copy()[0]).content), "queued while down");
    EXPECT_TRUE(client.connected());
    EXPECT_EQ(wire->opens(), 3);
    client.stop();
    EXPECT_TRUE(client.state() == ConnectionState::kDisconnected);
    EXPECT_TRUE(!client.send(text_message("qq", "after stop")));
  }

  {
    auto wire = std::make_shared<FakeWire>();
    ClientEndpoint client("qq", TargetConfig{"ws://fake/ws", ""}, fast_options(), BackoffConfig{10, 40, 2.0},
                          fake_factory(wire));
    std::mutex mu;
    std::vector<long long> delays;
    client.set_retry_observer([&](int, std::chrono::milliseconds delay) {
      std::lock_guard<std::mutex> lock(mu);
      delays.push_back(delay.count());
    });

    client.start();
    EXPECT_TRUE(client.connection().wait_for_state(ConnectionState::kOpen, std::chrono::milliseconds(2000)));
    {
      std::lock_guard<std::mutex> lock(wire->mu);
      wire->always_fail_open = true;
    }
    wire->break_socket();

    EXPECT_TRUE(wait_until([&]() {
      std::lock_guard<std::mutex> lock(mu);
      return delays.size() >= 4;
    }));
    client.stop();

    std::vector<long long> seen;
    {
      std::lock_guard<std::mutex> lock(mu);
      seen = delays;
    }
    EXPECT_EQ(seen[0], 10);
    EXPECT_EQ(seen[1], 20);
    EXPECT_EQ(seen[2], 40);
    EXPECT_EQ(seen[3], 40);

    const int opens_at_stop = wire->opens();
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(wire->opens(), opens_at_stop);
    {
      std::lock_guard<std::mutex> lock(mu);
      EXPECT_EQ(delays.size(), seen.size());
    }
    EXPECT_TRUE(client.state() == ConnectionState::kDisconnected);
  }

  {
    auto wire = std::make_shared<FakeWire>();
    wire->fail_sends = 1;
    ClientEndpoint client("qq", TargetConfig{"ws://fake/ws", ""}, fast_options(), BackoffConfig{5, 20, 2.0},
                          fake_factory(wire));
    client.start();
    EXPECT_TRUE(client.connection().wait_for_state(ConnectionState::kOpen, std::chrono::milliseconds(2000)));
    EXPECT_TRUE(client.send(text_message("qq", "first")));
    EXPECT_TRUE(client.send(text_message("qq", "second")));

    EXPECT_TRUE(wire->wait_sent(2, std::chrono::milliseconds(3000)));
    const auto sent = wire->sent_copy();
    EXPECT_EQ(sent.size(), static_cast<std::size_t>(2));
    EXPECT_EQ(plain_text(decode(sent[0]).content), "first");
    EXPECT_EQ(plain_text(decode(sent[1]).content), "second");
    EXPECT_EQ(wire->opens(), 2);
    client.stop();
  }
  return 0;
}

static int test_router() {
  std::map<std::string, std::shared_ptr<FakeWire>> wires;
  std::map<std::string, int> made;
  const ConnectionOptions opts = fast_options();
  const BackoffConfig backoff{5, 20, 2.0};
  Router::ClientFactory factory = [&](const std::string& platform, const TargetConfig& target) {
    ++made[platform];
    auto& wire = wires[platform];
    if (!wire) {
      wire = std::make_shared<FakeWire>();
    }
    return std::make_unique<ClientEndpoint>(platform, target, opts, backoff, fake_factory(wire));
  };

  RouteConfig routes;
  routes.route_config["qq"] = TargetConfig{"ws://qq.example/ws", "t1"};
  routes.route_config["test"] = TargetConfig{"ws://test.example/ws", ""};
  routes.route_config["old"] = TargetConfig{"ws://old.example/ws", ""};

  std::mutex mu;
  std::vector<std::string> calls;
  Router router(routes, opts, backoff, factory);

  router.register_handler([&](const Message& m) {
    {
      std::lock_guard<std::mutex> lock(mu);
      calls.push_back("first:" + plain_text(m.content));
    }
    throw std::runtime_error("handler exploded");
  });
  router.register_handler([&](const Message& m) {
    std::lock_guard<std::mutex> lock(mu);
    calls.push_back("second:" + plain_text(m.content));
  });

  EXPECT_TRUE(!router.send(text_message("qq", "not started")));
  router.start();
  EXPECT_TRUE(wait_until([&]() { return router.connected("qq") && router.connected("test"); }));

  EXPECT_TRUE(router.send(text_message("qq", "to qq")));
  EXPECT_TRUE(router.send(text_message("test", "to test")));
  EXPECT_TRUE(wires["qq"]->wait_sent(1, std::chrono::milliseconds(2000)));
  EXPECT_TRUE(wires["test"]->wait_sent(1, std::chrono::milliseconds(2000)));
  EXPECT_EQ(plain_text(decode(wires["qq"]->sent_copy()[0]).content), "to qq");
  EXPECT_EQ(plain_text(decode(wires["test"]->sent_copy()[0]).content), "to test");

  const auto unknown_before = metrics().get(counter::kUnknownPlatform);
  EXPECT_TRUE(throws<UnknownPlatform>([&]() { router.send(text_message("discord", "nowhere")); }));
  EXPECT_EQ(metrics().get(counter::kUnknownPlatform), unknown_before + 1);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(wires["qq"]->sent_copy().size(), static_cast<std::size_t>(1));
  EXPECT_EQ(wires["test"]->sent_copy().size(), static_cast<std::size_t>(1));

  wires["qq"]->push_text(encode(text_message("qq", "inbound")));
  EXPECT_TRUE(wait_until([&]() {
    std::lock_guard<std::mutex> lock(mu);
    return calls.size() >= 2;
  }));
  {
    std::lock_guard<std::mutex> lock(mu);
    EXPECT_EQ(calls[0], "first:inbound");
    EXPECT_EQ(calls[1], "second:inbound");
  }

  EXPECT_EQ(router.target_url(text_message("qq", "x")).value_or(""), "ws://qq.example/ws");
  EXPECT_TRUE(!router.target_url(text_message("discord", "x")).has_value());

  RouteConfig next;
  next.route_config["qq"] = TargetConfig{"ws://qq.example/ws", "t1"};
  next.route_config["test"] = TargetConfig{"ws://test2.example/ws", ""};
  next.route_config["kook"] = TargetConfig{"ws://kook.example/ws", ""};
  router.update_config(next);

  EXPECT_EQ(made["qq"], 1);
  EXPECT_EQ(made["test"], 2);
  EXPECT_EQ(made["kook"], 1);
  EXPECT_EQ(made["old"], 1);
  const auto platforms = router.platforms();
  EXPECT_EQ(platforms.size(), static_cast<std::size_t>(3));
  EXPECT_EQ(platforms[0], "kook");
  EXPECT_EQ(platforms[1], "qq");
  EXPECT_EQ(platforms[2], "test");
  EXPECT_TRUE(throws<UnknownPlatform>([&]() { router.send(text_message("old", "gone")); }));
  EXPECT_TRUE(wait_until([&]() { return router.connected("kook"); }));

  router.remove_platform("kook");
  EXPECT_TRUE(throws<UnknownPlatform>([&]() { router.send(text_message("kook", "gone")); }));

  router.stop();
  router.stop();
  EXPECT_TRUE(!router.running());
  EXPECT_TRUE(!router.send(text_message("qq", "stopped")));
  return 0;
}

static int test_server_with_fakes() {
  std::mutex mu;
  std::vector<std::string> calls;
  ServerEndpoint server(ServerConfig{}, fast_options());
  EXPECT_TRUE(server.verify_token(""));

  server.register_handler([&](const Message& m, const std::string& id) {
    std::lock_guard<std::mutex> lock(mu);
    calls.push_back("first:" + id + ":" + plain_text(m.content));
  });
  server.register_handler([&](const Message& m, const std::string& id) {
    std::lock_guard<std::mutex> lock(mu);
    calls.push_back("second:" + id + ":" + plain_text(m.content));
  });

  auto w1 = std::make_shared<FakeWire>();
  auto w2 = std::make_shared<FakeWire>();
  auto w3 = std::make_shared<FakeWire>();
  w1->platform = "qq";
  w2->fail_send = true;

  const std::string id1 = server.adopt(std::make_unique<FakeTransport>(w1));
  server.adopt(std::make_unique<FakeTransport>(w2));
  server.adopt(std::make_unique<FakeTransport>(w3));
  EXPECT_TRUE(wait_until([&]() { return server.connection_count() == 3; }));

  EXPECT_EQ(server.broadcast(text_message("qq", "hello all")), static_cast<std::size_t>(3));
  EXPECT_TRUE(w1->wait_sent(1, std::chrono::milliseconds(2000)));
  EXPECT_TRUE(w3->wait_sent(1, std::chrono::milliseconds(2000)));
  EXPECT_TRUE(w2->sent_copy().empty());
  EXPECT_TRUE(wait_until([&]() { return server.connection_count() == 2; }));

  EXPECT_TRUE(throws<NoSuchConnection>([&]() { server.send_to("conn-missing", text_message("qq", "x")); }));
  server.send_to(id1, text_message("qq", "direct"));
  EXPECT_TRUE(w1->wait_sent(2, std::chrono::milliseconds(2000)));

  EXPECT_TRUE(server.send_message(text_message("qq", "by platform")));
  EXPECT_TRUE(w1->wait_sent(3, std::chrono::milliseconds(2000)));
  EXPECT_TRUE(!server.send_to_platform("discord", text_message("discord", "nobody")));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(w3->sent_copy().size(), static_cast<std::size_t>(1));

  w1->push_text(encode(text_message("qq", "from peer")));
  EXPECT_TRUE(wait_until([&]() {
    std::lock_guard<std::mutex> lock(mu);
    return calls.size() >= 2;
  }));
  {
    std::lock_guard<std::mutex> lock(mu);
    EXPECT_EQ(calls[0], "first:" + id1 + ":from peer");
    EXPECT_EQ(calls[1], "second:" + id1 + ":from peer");
  }

  auto rejected = std::make_shared<FakeWire>();
  rejected->reject_auth = true;
  const auto rejected_before = metrics().get(counter::kServerRejected);
  const std::string rejected_id = server.adopt(std::make_unique<FakeTransport>(rejected));
  EXPECT_TRUE(wait_until([&]() { return metrics().get(counter::kServerRejected) > rejected_before; }));
  for (const auto& id : server.connection_ids()) {
    EXPECT_TRUE(id != rejected_id);
  }
  EXPECT_EQ(server.broadcast(text_message("qq", "second round")), static_cast<std::size_t>(2));
  EXPECT_TRUE(w3->wait_sent(2, std::chrono::milliseconds(2000)));
  EXPECT_TRUE(rejected->sent_copy().empty());

  server.stop();
  server.stop();
  EXPECT_EQ(server.connection_count(), static_cast<std::size_t>(0));
  EXPECT_TRUE(w1->closes() >= 1);
  EXPECT_TRUE(w3->closes() >= 1);
  return 0;
}

static int test_lifecycle_edges() {
  {
    ConnectionOptions opts = fast_options();
    opts.heartbeat_interval_ms = 20;
    opts.heartbeat_timeout_ms = 50;
    ServerEndpoint server(ServerConfig{}, opts);
    auto silent = std::make_shared<FakeWire>();
    silent->auto_pong = false;

    const auto accepted_before = metrics().get(counter::kServerAccepted);
    const std::string id = server.adopt(std::make_unique<FakeTransport>(silent));
    EXPECT_TRUE(wait_until([&]() { return metrics().get(counter::kServerAccepted) > accepted_before; }));
    EXPECT_TRUE(wait_until([&]() { return server.connection_count() == 0 && silent->closes() >= 1; }));
    EXPECT_TRUE(throws<NoSuchConnection>([&]() { server.send_to(id, text_message("qq", "late")); }));
    {
      std::lock_guard<std::mutex> lock(silent->mu);
      EXPECT_TRUE(silent->ping_calls >= 1);
    }
  }

  {
    auto wire = std::make_shared<FakeWire>();
    const BackoffConfig backoff{5, 20, 2.0};
    Router::ClientFactory factory = [&](const std::string& platform, const TargetConfig& target) {
      return std::make_unique<ClientEndpoint>(platform, target, fast_options(), backoff, fake_factory(wire));
    };
    RouteConfig routes;
    routes.route_config["qq"] = TargetConfig{"ws://qq.example/ws", ""};
    Router router(routes, fast_options(), backoff, factory);

    std::atomic<int> handled{0};
    router.register_handler([&](const Message&) {
      router.stop();
      ++handled;
    });
    router.start();
    EXPECT_TRUE(wait_until([&]() { return router.connected("qq"); }));

    wire->push_text(encode(text_message("qq", "shut down")));
    EXPECT_TRUE(wait_until([&]() { return handled.load() == 1; }));
    EXPECT_TRUE(!router.running());
    EXPECT_TRUE(wait_until([&]() { return wire->closes() >= 1; }));
    EXPECT_TRUE(!router.send(text_message("qq", "after stop")));

    router.stop();
    router.start();
    EXPECT_TRUE(wait_until([&]() { return router.connected("qq"); }));
    router.stop();
  }

  {
    ServerEndpoint server(ServerConfig{}, fast_options());
    std::atomic<int> handled{0};
    server.register_handler([&](const Message&, const std::string&) {
      server.stop();
      ++handled;
    });
    auto a = std::make_shared<FakeWire>();
    auto b = std::make_shared<FakeWire>();
    server.adopt(std::make_unique<FakeTransport>(a));
    server.adopt(std::make_unique<FakeTransport>(b));
    EXPECT_TRUE(wait_until([&]() { return server.connection_count() == 2; }));

    a->push_text(encode(text_message("qq", "shut down")));
    EXPECT_TRUE(wait_until([&]() { return handled.load() == 1; }));
    EXPECT_TRUE(wait_until([&]() { return a->closes() >= 1 && b->closes() >= 1; }));
    EXPECT_EQ(server.connection_count(), static_cast<std::size_t>(0));
    server.stop();
  }
  return 0;
}

static bool beast_handshake(int port, const std::string& target, const std::string& token,
                            websocket::stream<tcp::socket>& ws) {
  tcp::resolver resolver(ws.get_executor());
  net::connect(ws.next_layer(), resolver.resolve("127.0.0.1", std::to_string(port)));
  ws.set_option(websocket::stream_base::decorator([token](websocket::request_type& req) {
    if (!token.empty()) {
      req.set(http::field::authorization, token);
    }
    req.set("platform", "qq");
  }));
  try {
    ws.handshake("127.0.0.1", target);
  } catch (const boost::system::system_error&) {
    return false;
  }
  return true;
}

static int test_server_loopback() {
  ServerConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = 0;
  cfg.tokens = {"secret"};
  std::mutex mu;
  std::vector<std::string> received;
  ServerEndpoint server(cfg, fast_options());

  server.register_handler([&](const Message& m, const std::string&) {
    std::lock_guard<std::mutex> lock(mu);
    received.push_back(plain_text(m.content));
  });
  server.start();
  EXPECT_TRUE(server.port() > 0);

  EXPECT_TRUE(server.verify_token("secret"));
  EXPECT_TRUE(!server.verify_token(""));
  EXPECT_TRUE(!server.verify_token("rotated"));
  server.add_valid_token("rotated");
  EXPECT_TRUE(server.verify_token("rotated"));
  server.remove_valid_token("rotated");
  EXPECT_TRUE(!server.verify_token("rotated"));

  {
    const auto rejected_before = metrics().get(counter::kServerRejected);
    net::io_context ioc;
    websocket::stream<tcp::socket> ws(ioc);
    EXPECT_TRUE(!beast_handshake(server.port(), "/ws", "", ws));
    net::io_context ioc2;
    websocket::stream<tcp::socket> ws2(ioc2);
    EXPECT_TRUE(!beast_handshake(server.port(), "/ws", "wrong", ws2));
    EXPECT_TRUE(wait_until([&]() { return metrics().get(counter::kServerRejected) >= rejected_before + 2; }));
    EXPECT_EQ(server.connection_count(), static_cast<std::size_t>(0));
  }

  {
    net::io_context ioc;
    websocket::stream<tcp::socket> ws(ioc);
    EXPECT_TRUE(beast_handshake(server.port(), "/ws", "secret", ws));
    EXPECT_TRUE(wait_until([&]() { return server.connection_count() == 1; }));

    EXPECT_EQ(server.broadcast(text_message("qq", "over tcp")), static_cast<std::size_t>(1));
    beast::flat_buffer buffer;
    ws.read(buffer);
    const Message got = decode(beast::buffers_to_string(buffer.data()));
    EXPECT_EQ(plain_text(got.content), "over tcp");

    EXPECT_TRUE(server.send_to_platform("qq", text_message("qq", "platform header")));
    buffer.consume(buffer.size());
    ws.read(buffer);
    EXPECT_EQ(plain_text(decode(beast::buffers_to_string(buffer.data())).content), "platform header");

    ws.text(true);
    ws.write(net::buffer(encode(text_message("qq", "from client"))));
    EXPECT_TRUE(wait_until([&]() {
      std::lock_guard<std::mutex> lock(mu);
      return received.size() == 1;
    }));
    EXPECT_EQ(received[0], "from client");

    ws.close(websocket::close_code::normal);
    EXPECT_TRUE(wait_until([&]() { return server.connection_count() == 0; }));
  }

  {
    net::io_context ioc;
    websocket::stream<tcp::socket> ws(ioc);
    EXPECT_TRUE(beast_handshake(server.port(), "/ws?token=secret", "", ws));
    EXPECT_TRUE(wait_until([&]() { return server.connection_count() == 1; }));
  }

  server.stop();
  EXPECT_EQ(server.connection_count(), static_cast<std::size_t>(0));
  return 0;
}

static int test_config() {
  setenv("MAIMWIRE_TEST_TOKEN", "s3cret", 1);
  json root = default_config_json();
  root["server"]["token"] = "$MAIMWIRE_TEST_TOKEN";
  root["routes"] = {{"route_config",
                     {{"qq", {{"url", "ws://127.0.0.1:8000/ws"}, {"token", "${MAIMWIRE_TEST_TOKEN}"}}},
                      {"broken", {{"url", ""}}}}}};
  root["connection"]["heartbeatIntervalMs"] = 1500;
  root["backoff"]["maxMs"] = 900;

  const fs::path tmp = fs::temp_directory_path() / ("maimwire_test_cfg_" + random_id(10) + ".json");
  EXPECT_TRUE(write_text_file(tmp, root.dump(2)));
  const Config cfg = load_config(tmp);
  std::error_code ec;
  fs::remove(tmp, ec);

  EXPECT_EQ(cfg.server.tokens.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(cfg.server.tokens[0], "s3cret");
  EXPECT_EQ(cfg.server.port, 18000);
  EXPECT_EQ(cfg.routes.route_config.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(cfg.routes.route_config.at("qq").token, "s3cret");
  EXPECT_EQ(cfg.connection.heartbeat_interval_ms, 1500);
  EXPECT_EQ(cfg.connection.outbox_capacity, static_cast<std::size_t>(1024));
  EXPECT_EQ(cfg.backoff.max_ms, 900);
  EXPECT_EQ(cfg.backoff.initial_ms, 500);

  const Config missing = load_config(fs::temp_directory_path() / ("maimwire_absent_" + random_id(10) + ".json"));
  EXPECT_EQ(missing.server.path, "/ws");
  EXPECT_TRUE(missing.routes.route_config.empty());

  const RouteConfig plain = route_config_from_json(json{{"kook", {{"url", "ws://k/ws"}}}});
  EXPECT_EQ(plain.route_config.at("kook").url, "ws://k/ws");
  EXPECT_TRUE(route_config_to_json(plain)["route_config"].contains("kook"));
  return 0;
}

int main() {
  Logger::set_min_level(Logger::Level::kError);

  int failures = 0;
  failures += test_message_model();
  failures += test_backoff_and_outbox();
  failures += test_state_machine();
  failures += test_connection_session();
  failures += test_client_endpoint();
  failures += test_router();
  failures += test_server_with_fakes();
  failures += test_lifecycle_edges();
  failures += test_server_loopback();
  failures += test_config();

  if (failures != 0) {
    std::cerr << failures << " test group(s) failed\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
