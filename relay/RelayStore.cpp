#include "RelayStore.hpp"

#include "MemoryRelayStore.hpp"
#include "RedisRelayStore.hpp"
#include "RelayConfig.hpp"
#include "RelayUtil.hpp"

#include <cstdio>
#include <stdexcept>

namespace LinkHelper {

std::shared_ptr<RelayStore> makeRelayStore(const RelayConfig& config)
{
	switch (config.storeMode) {
		case RelayConfig::STORE_MODE_REDIS:
			return std::make_shared<RedisRelayStore>(config.redisConfig);
		case RelayConfig::STORE_MODE_MEMORY:
			fprintf(stderr, "%s: Using in-process memory store\n", _timestr());
			return std::make_shared<MemoryRelayStore>();
	}
	throw std::runtime_error("makeRelayStore: unsupported store mode");
}

}	// namespace LinkHelper
