#ifndef LH_RELAYCONFIG_HPP
#define LH_RELAYCONFIG_HPP

#include "Redis.hpp"
#include "RelayKeys.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

#define LH_DEFAULT_PRESENCE_WINDOW_SECONDS 10
#define LH_DEFAULT_MESSAGE_WINDOW_SECONDS 60
#define LH_DEFAULT_PULL_BATCH_SIZE 3

namespace LinkHelper {

struct RelayConfig {
	enum StoreMode {
		STORE_MODE_REDIS = 0,
		STORE_MODE_MEMORY = 1,
	};

	// device is considered offline if it does not call in within this
	std::chrono::seconds presenceWindow;

	// undelivered messages are discarded after this
	std::chrono::seconds messageWindow;

	long long defaultPullBatchSize;
	std::string keyPrefix;
	StoreMode storeMode;
	std::string metricsFile;
	RedisConfig redisConfig;

	RelayConfig()
		: presenceWindow(LH_DEFAULT_PRESENCE_WINDOW_SECONDS)
		, messageWindow(LH_DEFAULT_MESSAGE_WINDOW_SECONDS)
		, defaultPullBatchSize(LH_DEFAULT_PULL_BATCH_SIZE)
		, keyPrefix(LH_DEFAULT_KEY_PREFIX)
		, storeMode(STORE_MODE_REDIS)
		, metricsFile("")
		, redisConfig()
	{
	}

	/**
	 * Build a configuration from a "settings" object, keeping defaults for absent fields
	 *
	 * @throws std::runtime_error on invalid values
	 */
	static RelayConfig fromJson(const nlohmann::json& settings);

	/**
	 * Apply LH_* environment variable overrides
	 */
	void applyEnvironment();

	/**
	 * @throws std::runtime_error if any value is out of range
	 */
	void validate() const;

	static StoreMode parseStoreMode(const std::string& mode);
	static const char* storeModeName(StoreMode mode);
};

/**
 * Load configuration from a JSON file, then apply environment overrides
 *
 * The file holds an object with a "settings" member. An empty path yields
 * defaults plus environment overrides.
 *
 * @throws std::runtime_error if the file cannot be read, parsed, or holds invalid values
 */
RelayConfig loadRelayConfig(const std::string& path);

}	// namespace LinkHelper

#endif	 // LH_RELAYCONFIG_HPP
