#include "TestUtil.hpp"
#include "relay/MemoryRelayStore.hpp"
#include "relay/RelayConfig.hpp"
#include "relay/RelayKeys.hpp"
#include "service/RelayCommand.hpp"

#include <catch2/catch.hpp>
#include <cstdio>
#include <nlohmann/json.hpp>

using namespace LinkHelper;

namespace {

// Reads back everything written to a tmpfile()
std::string slurp(FILE* f)
{
	std::string s;
	rewind(f);
	char buf[1024];
	std::size_t n;
	while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
		s.append(buf, n);
	}
	return s;
}

struct CommandFixture {
	RelayConfig rc;
	std::shared_ptr<MemoryRelayStore> store;
	std::string out;
	std::string err;

	CommandFixture() : store(std::make_shared<MemoryRelayStore>())
	{
		rc.storeMode = RelayConfig::STORE_MODE_MEMORY;
	}

	int run(const std::vector<std::string>& args)
	{
		FILE* o = tmpfile();
		FILE* e = tmpfile();
		REQUIRE(o);
		REQUIRE(e);
		int rv = runRelayCommand(args, rc, store, o, e);
		out = slurp(o);
		err = slurp(e);
		fclose(o);
		fclose(e);
		return rv;
	}
};

}	// anonymous namespace

TEST_CASE_METHOD(CommandFixture, "Commands print JSON results and exit 0", "[RelayCommand]")
{
	const std::string a = Test::deviceId('a');
	REQUIRE(run({ "presence", "ip1", Test::makeInfo(a).serialize() }) == LH_EXIT_OK);
	CHECK(out == "OK\n");

	REQUIRE(run({ "devices", "ip1" }) == LH_EXIT_OK);
	nlohmann::json devices = nlohmann::json::parse(out);
	REQUIRE(devices.is_array());
	REQUIRE(devices.size() == 1);
	CHECK(DeviceInfo::fromJson(devices[0]) == Test::makeInfo(a));

	REQUIRE(run({ "push", "ip1", Test::makeMessage(a, "cmd", 7).serialize() }) == LH_EXIT_OK);
	CHECK(out == "OK\n");

	REQUIRE(run({ "pull", "ip1", a, "5" }) == LH_EXIT_OK);
	nlohmann::json messages = nlohmann::json::parse(out);
	REQUIRE(messages.size() == 1);
	CHECK(DeviceMessage::fromJson(messages[0]) == Test::makeMessage(a, "cmd", 7));

	REQUIRE(run({ "pull", "ip1", a }) == LH_EXIT_OK);
	CHECK(nlohmann::json::parse(out).empty());
}

TEST_CASE_METHOD(CommandFixture, "Invalid input exits 2", "[RelayCommand]")
{
	const std::string a = Test::deviceId('a');
	CHECK(run({ "push", "ip1", "{" }) == LH_EXIT_BAD_INPUT);
	CHECK(err.find("invalid input") != std::string::npos);
	CHECK(out.empty());

	CHECK(run({ "presence", "ip1", "{\"device_id\":\"short\"}" }) == LH_EXIT_BAD_INPUT);
	CHECK(run({ "pull", "ip1", "not-a-device-id" }) == LH_EXIT_BAD_INPUT);
	CHECK(run({ "pull", "ip1", a, "0" }) == LH_EXIT_BAD_INPUT);
	CHECK(run({ "pull", "ip1", a, "-3" }) == LH_EXIT_BAD_INPUT);
	CHECK(run({ "pull", "ip1", a, "lots" }) == LH_EXIT_BAD_INPUT);
}

TEST_CASE_METHOD(CommandFixture, "Unknown commands and wrong arity print usage and exit 2", "[RelayCommand]")
{
	CHECK(run({}) == LH_EXIT_BAD_INPUT);
	CHECK(run({ "frobnicate" }) == LH_EXIT_BAD_INPUT);
	CHECK(err.find("Usage:") != std::string::npos);
	CHECK(run({ "devices" }) == LH_EXIT_BAD_INPUT);
	CHECK(run({ "push", "ip1" }) == LH_EXIT_BAD_INPUT);
}

TEST_CASE_METHOD(CommandFixture, "Store errors exit 1", "[RelayCommand]")
{
	// a string where the presence sorted set should be
	const std::string key = RelayKeys(rc.keyPrefix).presence("ip1");
	auto tx = store->transaction(key);
	tx->setex(key, std::chrono::seconds(600), "not a sorted set");
	tx->exec();

	CHECK(run({ "devices", "ip1" }) == LH_EXIT_STORE_ERROR);
	CHECK(err.find("store error") != std::string::npos);
	CHECK(out.empty());
}

TEST_CASE("The configured memory store backs a command", "[RelayCommand]")
{
	RelayConfig rc;
	rc.storeMode = RelayConfig::STORE_MODE_MEMORY;
	FILE* o = tmpfile();
	REQUIRE(o);
	CHECK(runRelayCommand({ "devices", "ip1" }, rc, o, stderr) == LH_EXIT_OK);
	CHECK(slurp(o) == "[]\n");
	fclose(o);
}
