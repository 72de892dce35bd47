#include "TestUtil.hpp"
#include "node/Metrics.hpp"
#include "relay/Mailbox.hpp"
#include "relay/MemoryRelayStore.hpp"
#include "relay/PresenceRegistry.hpp"
#include "relay/RelayConfig.hpp"

#include <atomic>
#include <catch2/catch.hpp>
#include <set>
#include <thread>
#include <vector>

using namespace LinkHelper;

namespace {

struct MailboxFixture {
	Test::FakeClock fc;
	std::shared_ptr<MemoryRelayStore> store;
	Mailbox mailbox;

	MailboxFixture()
		: store(std::make_shared<MemoryRelayStore>(fc.clock()))
		, mailbox(store, RelayKeys(), std::chrono::seconds(60), 3, fc.clock())
	{
	}

	void push(const std::string& ip, const DeviceMessage& m, double now)
	{
		fc.t = now;
		mailbox.pushMessage(ip, m.deviceId(), m, now);
	}

	std::vector<DeviceMessage> pull(const std::string& ip, const std::string& id, long long count, double now)
	{
		fc.t = now;
		return mailbox.pullMessages(ip, id, count, now);
	}
};

}	// anonymous namespace

TEST_CASE_METHOD(MailboxFixture, "Messages drain oldest first in batches", "[Mailbox]")
{
	const std::string a = Test::deviceId('a');
	DeviceMessage m1 = Test::makeMessage(a, "cmd", 1);
	DeviceMessage m2 = Test::makeMessage(a, "cmd", 2);
	DeviceMessage m3 = Test::makeMessage(a, "cmd", 3);
	push("ip1", m3, 3.0);
	push("ip1", m1, 1.0);
	push("ip1", m2, 2.0);

	std::vector<DeviceMessage> first = pull("ip1", a, 2, 4.0);
	REQUIRE(first.size() == 2);
	CHECK(first[0] == m1);
	CHECK(first[1] == m2);

	std::vector<DeviceMessage> second = pull("ip1", a, 2, 4.0);
	REQUIRE(second.size() == 1);
	CHECK(second[0] == m3);

	CHECK(pull("ip1", a, 2, 4.0).empty());
}

TEST_CASE_METHOD(MailboxFixture, "A pull never returns more than the requested count", "[Mailbox]")
{
	const std::string a = Test::deviceId('a');
	for (int i = 0; i < 5; ++i) {
		push("ip1", Test::makeMessage(a, "cmd", i), (double)i);
	}
	CHECK(pull("ip1", a, 3, 10.0).size() == 3);
	CHECK(pull("ip1", a, 3, 10.0).size() == 2);
}

TEST_CASE_METHOD(MailboxFixture, "Messages older than the window are never delivered", "[Mailbox]")
{
	const std::string a = Test::deviceId('a');
	push("ip1", Test::makeMessage(a, "stale", 1), 0.0);
	push("ip1", Test::makeMessage(a, "fresh", 2), 30.0);

	std::vector<DeviceMessage> got = pull("ip1", a, 10, 60.1);
	REQUIRE(got.size() == 1);
	CHECK(got[0].type() == "fresh");
}

TEST_CASE_METHOD(MailboxFixture, "A message is expired exactly one window after it was queued", "[Mailbox]")
{
	const std::string a = Test::deviceId('a');
	push("ip1", Test::makeMessage(a, "cmd", 1), 0.0);
	CHECK(pull("ip1", a, 3, 60.0).empty());
}

TEST_CASE_METHOD(MailboxFixture, "Pushing prunes expired messages", "[Mailbox]")
{
	const std::string a = Test::deviceId('a');
	push("ip1", Test::makeMessage(a, "old", 1), 0.0);
	push("ip1", Test::makeMessage(a, "new", 2), 59.0);
	push("ip1", Test::makeMessage(a, "newer", 3), 61.0);

	auto tx = store->transaction("x");
	tx->zrangebyscore(RelayKeys().messageQueue("ip1", a), -1e9);
	StoreReplies r = tx->exec();
	CHECK(r[0].members.size() == 2);
}

TEST_CASE_METHOD(MailboxFixture, "Pushed message is pulled once", "[Mailbox]")
{
	const std::string a(32, 'A');
	DeviceMessage m(a, "cmd", nlohmann::json { { "x", 1 } });
	push("ip1", m, 0.0);

	std::vector<DeviceMessage> got = pull("ip1", a, 3, 5.0);
	REQUIRE(got.size() == 1);
	CHECK(got[0] == m);
	CHECK(got[0].data()["x"] == 1);

	CHECK(pull("ip1", a, 3, 5.0).empty());
}

TEST_CASE_METHOD(MailboxFixture, "Identical messages queued at the same time collapse", "[Mailbox]")
{
	const std::string a = Test::deviceId('a');
	push("ip1", Test::makeMessage(a, "cmd", 1), 5.0);
	push("ip1", Test::makeMessage(a, "cmd", 1), 5.0);
	CHECK(pull("ip1", a, 10, 6.0).size() == 1);
}

TEST_CASE_METHOD(MailboxFixture, "Mailboxes are per device and per client address", "[Mailbox]")
{
	const std::string a = Test::deviceId('a');
	const std::string b = Test::deviceId('b');
	push("ip1", Test::makeMessage(a, "for-a", 1), 1.0);
	push("ip1", Test::makeMessage(b, "for-b", 1), 1.0);

	CHECK(pull("ip2", a, 3, 2.0).empty());
	std::vector<DeviceMessage> got = pull("ip1", b, 3, 2.0);
	REQUIRE(got.size() == 1);
	CHECK(got[0].type() == "for-b");
	CHECK(pull("ip1", a, 3, 2.0).size() == 1);
}

TEST_CASE_METHOD(MailboxFixture, "Malformed payloads are dropped from a pull", "[Mailbox]")
{
	const std::string a = Test::deviceId('a');
	const std::string key = RelayKeys().messageQueue("ip1", a);
	push("ip1", Test::makeMessage(a, "cmd", 1), 1.0);

	auto tx = store->transaction(key);
	tx->zadd(key, "not json", 2.0).zadd(key, "{\"device_id\":\"short\",\"type\":\"cmd\",\"data\":{}}", 3.0);
	tx->exec();
	push("ip1", Test::makeMessage(a, "cmd", 4), 4.0);

	const auto deliveredBefore = Metrics::message_delivered.value();
	const auto malformedBefore = Metrics::message_malformed.value();
	std::vector<DeviceMessage> got = pull("ip1", a, 10, 5.0);
	REQUIRE(got.size() == 2);
	CHECK(got[0].data()["x"] == 1);
	CHECK(got[1].data()["x"] == 4);
	CHECK_FALSE(store->exists(key));

	// dropped payloads are counted as malformed only
	CHECK(Metrics::message_delivered.value() - deliveredBefore == 2);
	CHECK(Metrics::message_malformed.value() - malformedBefore == 2);
}

TEST_CASE_METHOD(MailboxFixture, "A non-positive count pulls nothing", "[Mailbox]")
{
	const std::string a = Test::deviceId('a');
	push("ip1", Test::makeMessage(a, "cmd", 1), 1.0);
	CHECK(pull("ip1", a, 0, 2.0).empty());
	CHECK(pull("ip1", a, -4, 2.0).empty());
	CHECK(pull("ip1", a, 1, 2.0).size() == 1);
}

TEST_CASE_METHOD(MailboxFixture, "The queue key expires one window after the last push", "[Mailbox]")
{
	const std::string a = Test::deviceId('a');
	push("ip1", Test::makeMessage(a, "cmd", 1), 100.0);
	push("ip1", Test::makeMessage(a, "cmd", 2), 130.0);

	fc.t = 189.9;
	CHECK(store->exists(RelayKeys().messageQueue("ip1", a)));
	fc.t = 190.0;
	CHECK_FALSE(store->exists(RelayKeys().messageQueue("ip1", a)));
}

TEST_CASE("Default pull uses the configured batch size", "[Mailbox]")
{
	Test::FakeClock fc;
	auto store = std::make_shared<MemoryRelayStore>(fc.clock());
	RelayConfig rc;
	Mailbox mailbox(store, rc, fc.clock());
	REQUIRE(mailbox.defaultPullBatchSize() == LH_DEFAULT_PULL_BATCH_SIZE);

	const std::string a = Test::deviceId('a');
	for (int i = 0; i < LH_DEFAULT_PULL_BATCH_SIZE + 2; ++i) {
		fc.t = (double)i;
		mailbox.pushMessage("ip1", a, Test::makeMessage(a, "cmd", i));
	}
	CHECK(mailbox.pullMessages("ip1", a).size() == LH_DEFAULT_PULL_BATCH_SIZE);
	CHECK(mailbox.pullMessages("ip1", a).size() == 2);
}

TEST_CASE("Presence and message windows are independent", "[Mailbox][PresenceRegistry]")
{
	Test::FakeClock fc;
	auto store = std::make_shared<MemoryRelayStore>(fc.clock());
	PresenceRegistry registry(store, RelayKeys(), std::chrono::seconds(10), fc.clock());
	Mailbox mailbox(store, RelayKeys(), std::chrono::seconds(60), 3, fc.clock());

	const std::string a = Test::deviceId('a');
	registry.updatePresence("ip1", a, Test::makeInfo(a), 0.0);
	mailbox.pushMessage("ip1", a, Test::makeMessage(a, "cmd", 1), 0.0);

	fc.t = 30.0;
	CHECK(registry.listActiveDevices("ip1", 30.0).empty());
	CHECK(mailbox.pullMessages("ip1", a, 3, 30.0).size() == 1);

	// and the other way round
	PresenceRegistry longPresence(store, RelayKeys(), std::chrono::seconds(120), fc.clock());
	Mailbox shortMailbox(store, RelayKeys(), std::chrono::seconds(5), 3, fc.clock());
	longPresence.updatePresence("ip1", a, Test::makeInfo(a), 30.0);
	shortMailbox.pushMessage("ip1", a, Test::makeMessage(a, "cmd", 2), 30.0);

	fc.t = 40.0;
	CHECK(shortMailbox.pullMessages("ip1", a, 3, 40.0).empty());
	CHECK(longPresence.listActiveDevices("ip1", 40.0).size() == 1);
}

TEST_CASE("Concurrent pushers and pullers deliver every message exactly once", "[Mailbox]")
{
	Test::FakeClock fc;
	fc.t = 10.0;
	auto store = std::make_shared<MemoryRelayStore>(fc.clock());
	Mailbox mailbox(store, RelayKeys(), std::chrono::seconds(60), 3, fc.clock());

	const std::string a = Test::deviceId('a');
	const int pushers = 4;
	const int pullers = 3;
	const int perPusher = 200;
	const int total = pushers * perPusher;

	std::atomic<int> pulled(0);
	std::vector<std::vector<int> > seen(pullers);
	std::vector<std::thread> threads;
	for (int p = 0; p < pushers; ++p) {
		threads.emplace_back([&mailbox, &a, p, perPusher]() {
			for (int i = 0; i < perPusher; ++i) {
				mailbox.pushMessage("ip1", a, Test::makeMessage(a, "cmd", (p * perPusher) + i), 10.0);
			}
		});
	}
	for (int q = 0; q < pullers; ++q) {
		threads.emplace_back([&mailbox, &a, &pulled, &seen, q, total]() {
			// gives up after a bounded number of empty pulls so a lost message fails instead of hanging
			int idle = 0;
			while ((pulled.load() < total) && (idle < 100000)) {
				std::vector<DeviceMessage> got = mailbox.pullMessages("ip1", a, 3, 10.0);
				if (got.empty()) {
					++idle;
					std::this_thread::yield();
					continue;
				}
				idle = 0;
				for (const auto& m : got) {
					seen[q].push_back(m.data()["x"].get<int>());
				}
				pulled += (int)got.size();
			}
		});
	}
	for (auto& t : threads) {
		t.join();
	}

	std::multiset<int> all;
	for (const auto& s : seen) {
		all.insert(s.begin(), s.end());
	}
	CHECK(all.size() == (std::size_t)total);
	std::set<int> unique(all.begin(), all.end());
	CHECK(unique.size() == all.size());
	CHECK(*unique.begin() == 0);
	CHECK(*unique.rbegin() == total - 1);
	CHECK(mailbox.pullMessages("ip1", a, 3, 10.0).empty());
}
