#include "RelayConfig.hpp"

#include "../osdep/OSUtils.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace LinkHelper {

namespace {

const nlohmann::json& member(const nlohmann::json& obj, const char* name)
{
	static const nlohmann::json nullValue;
	if (! obj.is_object()) {
		return nullValue;
	}
	nlohmann::json::const_iterator i = obj.find(name);
	return (i == obj.end()) ? nullValue : *i;
}

// Present settings must be whole numbers, absent ones keep their default
int64_t integerSetting(const nlohmann::json& obj, const char* name, int64_t dfl)
{
	const nlohmann::json& v = member(obj, name);
	if (v.is_null()) {
		return dfl;
	}
	const int64_t bad = std::numeric_limits<int64_t>::min();
	const int64_t i = OSUtils::jsonInt(v, bad);
	if ((i == bad) || (i < std::numeric_limits<int>::min()) || (i > std::numeric_limits<int>::max())) {
		throw std::runtime_error(std::string("RelayConfig: ") + name + " must be an integer");
	}
	return i;
}

}	// anonymous namespace

RelayConfig::StoreMode RelayConfig::parseStoreMode(const std::string& mode)
{
	if (mode == "redis") {
		return STORE_MODE_REDIS;
	}
	else if (mode == "memory") {
		return STORE_MODE_MEMORY;
	}
	throw std::runtime_error("RelayConfig: unknown store mode \"" + mode + "\" (expected redis or memory)");
}

const char* RelayConfig::storeModeName(StoreMode mode)
{
	switch (mode) {
		case STORE_MODE_REDIS:
			return "redis";
		case STORE_MODE_MEMORY:
			return "memory";
	}
	return "unknown";
}

RelayConfig RelayConfig::fromJson(const nlohmann::json& settings)
{
	if ((! settings.is_null()) && (! settings.is_object())) {
		throw std::runtime_error("RelayConfig: settings must be a JSON object");
	}

	RelayConfig rc;
	rc.presenceWindow =
		std::chrono::seconds(integerSetting(settings, "presenceWindowSeconds", rc.presenceWindow.count()));
	rc.messageWindow =
		std::chrono::seconds(integerSetting(settings, "messageWindowSeconds", rc.messageWindow.count()));
	rc.defaultPullBatchSize = integerSetting(settings, "defaultPullBatchSize", rc.defaultPullBatchSize);
	rc.keyPrefix = OSUtils::jsonString(member(settings, "keyPrefix"), rc.keyPrefix.c_str());
	rc.metricsFile = OSUtils::jsonString(member(settings, "metricsFile"), "");

	const nlohmann::json& mode = member(settings, "storeMode");
	if (! mode.is_null()) {
		rc.storeMode = parseStoreMode(OSUtils::jsonString(mode, ""));
	}

	const nlohmann::json& redis = member(settings, "redis");
	if (redis.is_object()) {
		rc.redisConfig.hostname = OSUtils::jsonString(member(redis, "hostname"), rc.redisConfig.hostname.c_str());
		rc.redisConfig.port = (int)integerSetting(redis, "port", rc.redisConfig.port);
		rc.redisConfig.password = OSUtils::jsonString(member(redis, "password"), "");
		rc.redisConfig.clusterMode = OSUtils::jsonBool(member(redis, "clusterMode"), false);
	}

	rc.validate();
	return rc;
}

void RelayConfig::applyEnvironment()
{
	std::string v = OSUtils::getEnv("LH_REDIS_HOST");
	if (! v.empty()) {
		redisConfig.hostname = v;
	}
	v = OSUtils::getEnv("LH_REDIS_PORT");
	if (! v.empty()) {
		redisConfig.port = (int)OSUtils::jsonInt(nlohmann::json(v), -1);
	}
	v = OSUtils::getEnv("LH_REDIS_PASSWORD");
	if (! v.empty()) {
		redisConfig.password = v;
	}
	v = OSUtils::getEnv("LH_REDIS_CLUSTER");
	if (! v.empty()) {
		redisConfig.clusterMode = OSUtils::jsonBool(nlohmann::json(v), false);
	}
	v = OSUtils::getEnv("LH_STORE_MODE");
	if (! v.empty()) {
		storeMode = parseStoreMode(v);
	}
	validate();
}

void RelayConfig::validate() const
{
	if (presenceWindow.count() <= 0) {
		throw std::runtime_error("RelayConfig: presenceWindowSeconds must be positive");
	}
	if (messageWindow.count() <= 0) {
		throw std::runtime_error("RelayConfig: messageWindowSeconds must be positive");
	}
	if (defaultPullBatchSize <= 0) {
		throw std::runtime_error("RelayConfig: defaultPullBatchSize must be positive");
	}
	if (keyPrefix.empty()) {
		throw std::runtime_error("RelayConfig: keyPrefix may not be empty");
	}
	if ((redisConfig.port <= 0) || (redisConfig.port > 65535)) {
		throw std::runtime_error("RelayConfig: redis port must be between 1 and 65535");
	}
}

RelayConfig loadRelayConfig(const std::string& path)
{
	RelayConfig rc;
	if (! path.empty()) {
		std::string buf;
		if (! OSUtils::readFile(path.c_str(), buf)) {
			throw std::runtime_error("RelayConfig: unable to read " + path);
		}
		nlohmann::json lc;
		try {
			lc = nlohmann::json::parse(buf);
		}
		catch (const nlohmann::json::parse_error& e) {
			throw std::runtime_error("RelayConfig: " + path + " is not valid JSON: " + e.what());
		}
		if (! lc.is_object()) {
			throw std::runtime_error("RelayConfig: " + path + " must contain a JSON object");
		}
		rc = RelayConfig::fromJson(member(lc, "settings"));
	}
	rc.applyEnvironment();
	return rc;
}

}	// namespace LinkHelper
