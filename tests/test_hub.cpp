#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <map>
#include <set>
#include <thread>

#include "freigent/hub/hub.hpp"

using namespace freigent;
using namespace freigent::hub;

// --- Message ---

TEST(MessageTest, JsonRoundTrip) {
  Message msg("m1", "u1", "u2", {{"type", "recommendation_request"}, {"query", "lamp"}});

  auto j = msg.to_json();
  EXPECT_EQ(j["message_id"], "m1");
  EXPECT_EQ(j["from_agent_id"], "u1");
  EXPECT_EQ(j["to_agent_id"], "u2");
  EXPECT_EQ(j["payload"]["query"], "lamp");

  auto back = Message::from_json(j);
  EXPECT_EQ(back.id(), "m1");
  EXPECT_EQ(back.type(), "recommendation_request");
  EXPECT_EQ(back.payload(), msg.payload());
}

TEST(MessageTest, TypeMustBeString) {
  Message msg("m1", "a", "b", {{"type", 42}});
  EXPECT_EQ(msg.type(), "");
}

TEST(AgentRecordTest, Json) {
  AgentRecord record{"u1", "freigent", "Alice", "calm"};
  EXPECT_EQ(AgentRecord::from_json(record.to_json()), record);
}

// --- AgentDirectory ---

TEST(AgentDirectoryTest, UpsertKeepsFirstSeenOrder) {
  AgentDirectory dir;

  EXPECT_TRUE(dir.upsert({"a", "freigent", "Alice", ""}));
  EXPECT_TRUE(dir.upsert({"b", "freigent", "Bob", ""}));

  // 重复注册覆盖字段但不改变位置
  EXPECT_FALSE(dir.upsert({"a", "other", "Alice 2", "calm"}));

  auto list = dir.list();
  ASSERT_EQ(list.size(), 2);
  EXPECT_EQ(list[0].agent_id, "a");
  EXPECT_EQ(list[0].agent_type, "other");
  EXPECT_EQ(list[0].display_name, "Alice 2");
  EXPECT_EQ(list[0].personality_summary, "calm");
  EXPECT_EQ(list[1].agent_id, "b");
}

TEST(AgentDirectoryTest, GetUnknown) {
  AgentDirectory dir;
  EXPECT_FALSE(dir.get("nobody").has_value());
  EXPECT_FALSE(dir.contains("nobody"));
  EXPECT_EQ(dir.size(), 0);
}

// --- MailboxStore ---

TEST(MailboxStoreTest, FifoAndDrain) {
  MailboxStore store;

  auto m1 = store.send("a", "b", {{"n", 1}});
  auto m2 = store.send("c", "b", {{"n", 2}});
  EXPECT_NE(m1.id(), m2.id());

  auto got = store.receive("b");
  ASSERT_EQ(got.size(), 2);
  EXPECT_EQ(got[0].id(), m1.id());
  EXPECT_EQ(got[0].from_agent_id(), "a");
  EXPECT_EQ(got[0].to_agent_id(), "b");
  EXPECT_EQ(got[0].payload()["n"], 1);
  EXPECT_EQ(got[1].id(), m2.id());

  EXPECT_TRUE(store.receive("b").empty());
}

TEST(MailboxStoreTest, PeekDoesNotClear) {
  MailboxStore store;
  store.send("a", "b", json::object());

  EXPECT_EQ(store.receive("b", false).size(), 1);
  EXPECT_EQ(store.pending("b"), 1);
  EXPECT_EQ(store.receive("b", true).size(), 1);
  EXPECT_EQ(store.pending("b"), 0);
}

TEST(MailboxStoreTest, MissingMailboxReadsEmpty) {
  MailboxStore store;
  EXPECT_TRUE(store.receive("ghost").empty());
  EXPECT_FALSE(store.has_mailbox("ghost"));
  EXPECT_EQ(store.pending("ghost"), 0);

  store.ensure("ghost");
  EXPECT_TRUE(store.has_mailbox("ghost"));
  EXPECT_TRUE(store.receive("ghost").empty());
}

TEST(MailboxStoreTest, NullPayloadBecomesObject) {
  MailboxStore store;
  auto msg = store.send("a", "b", nullptr);
  EXPECT_TRUE(msg.payload().is_object());
  EXPECT_EQ(msg.type(), "");
}

TEST(MailboxStoreTest, ConcurrentSendsAndDrainsPartition) {
  MailboxStore store;
  constexpr int kSenders = 4;
  constexpr int kPerSender = 250;

  std::atomic<bool> done{false};
  std::vector<std::vector<Message>> drained(2);

  std::vector<std::thread> drainers;
  for (int d = 0; d < 2; ++d) {
    drainers.emplace_back([&, d]() {
      while (!done.load()) {
        auto batch = store.receive("sink");
        drained[d].insert(drained[d].end(), batch.begin(), batch.end());
      }
    });
  }

  std::vector<std::thread> senders;
  for (int s = 0; s < kSenders; ++s) {
    senders.emplace_back([&, s]() {
      for (int i = 0; i < kPerSender; ++i) {
        store.send("sender-" + std::to_string(s), "sink", {{"seq", i}});
      }
    });
  }
  for (auto& t : senders) t.join();
  done.store(true);
  for (auto& t : drainers) t.join();

  // Whatever is left after the drainers stopped
  auto rest = store.receive("sink");

  std::set<std::string> ids;
  size_t total = rest.size();
  for (const auto& m : rest) ids.insert(m.id());
  for (const auto& batch : drained) {
    total += batch.size();
    for (const auto& m : batch) ids.insert(m.id());
  }

  // 不丢失、不重复
  EXPECT_EQ(total, static_cast<size_t>(kSenders * kPerSender));
  EXPECT_EQ(ids.size(), total);
}

TEST(MailboxStoreTest, PerSenderOrderPreserved) {
  MailboxStore store;

  std::vector<std::thread> senders;
  for (int s = 0; s < 3; ++s) {
    senders.emplace_back([&, s]() {
      for (int i = 0; i < 100; ++i) {
        store.send("s" + std::to_string(s), "sink", {{"seq", i}});
      }
    });
  }
  for (auto& t : senders) t.join();

  std::map<std::string, int> last;
  for (const auto& m : store.receive("sink")) {
    int seq = m.payload()["seq"];
    auto it = last.find(m.from_agent_id());
    if (it != last.end()) {
      EXPECT_GT(seq, it->second);
    }
    last[m.from_agent_id()] = seq;
  }
  EXPECT_EQ(last.size(), 3);
}

// --- Hub ---

TEST(HubTest, RegisterIsIdempotent) {
  Hub hub;

  hub.register_agent("u1", "freigent", "Alice", "quiet");
  hub.send("x", "u1", {{"type", "ping"}});
  hub.register_agent("u1", "freigent", "Alice B", "loud");

  auto agents = hub.list_agents();
  ASSERT_EQ(agents.size(), 1);
  EXPECT_EQ(agents[0].display_name, "Alice B");
  EXPECT_EQ(agents[0].personality_summary, "loud");

  // Re-registration must not touch the mailbox
  EXPECT_EQ(hub.pending("u1"), 1);
}

TEST(HubTest, SendToUnregisteredAgent) {
  Hub hub;
  auto msg = hub.send("a", "nobody", {{"type", "hello"}});

  EXPECT_FALSE(hub.get_agent("nobody").has_value());
  auto got = hub.receive("nobody");
  ASSERT_EQ(got.size(), 1);
  EXPECT_EQ(got[0].id(), msg.id());
  EXPECT_EQ(got[0].type(), "hello");
}

TEST(HubTest, HubsAreIsolated) {
  Hub a;
  Hub b;
  a.register_agent("u1", "freigent", "Alice");
  a.send("x", "u1", json::object());

  EXPECT_TRUE(b.list_agents().empty());
  EXPECT_TRUE(b.receive("u1").empty());
  EXPECT_EQ(a.pending("u1"), 1);
}

TEST(HubTest, PublishesEvents) {
  Hub hub;

  std::vector<events::AgentRegistered> registered;
  std::vector<events::MessageSent> sent;
  std::vector<events::MailboxDrained> drained;

  hub.bus().subscribe<events::AgentRegistered>([&](const events::AgentRegistered& e) {
    registered.push_back(e);
  });
  hub.bus().subscribe<events::MessageSent>([&](const events::MessageSent& e) {
    sent.push_back(e);
  });
  hub.bus().subscribe<events::MailboxDrained>([&](const events::MailboxDrained& e) {
    drained.push_back(e);
  });

  hub.register_agent("u1", "freigent", "Alice");
  hub.register_agent("u1", "freigent", "Alice");
  auto msg = hub.send("u2", "u1", {{"type", "recommendation_request"}});
  hub.receive("u1", false);
  hub.receive("u1");

  ASSERT_EQ(registered.size(), 2);
  EXPECT_FALSE(registered[0].replaced);
  EXPECT_TRUE(registered[1].replaced);

  ASSERT_EQ(sent.size(), 1);
  EXPECT_EQ(sent[0].message_id, msg.id());
  EXPECT_EQ(sent[0].payload_type, "recommendation_request");

  // A peek is not a drain
  ASSERT_EQ(drained.size(), 1);
  EXPECT_EQ(drained[0].agent_id, "u1");
  EXPECT_EQ(drained[0].message_count, 1);
}

// --- Bus ---

TEST(BusTest, SubscribeAndUnsubscribe) {
  Bus bus;
  int calls = 0;

  auto id = bus.subscribe<events::MailboxDrained>([&](const events::MailboxDrained& e) {
    calls += static_cast<int>(e.message_count);
  });
  EXPECT_EQ(bus.subscriber_count(), 1);

  bus.publish(events::MailboxDrained{"a", 3});
  // Other event types do not reach this handler
  bus.publish(events::MessageSent{"m", "a", "b", ""});
  EXPECT_EQ(calls, 3);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriber_count(), 0);
  bus.publish(events::MailboxDrained{"a", 5});
  EXPECT_EQ(calls, 3);
}
