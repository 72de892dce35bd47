#ifndef LH_REDISRELAYSTORE_HPP
#define LH_REDISRELAYSTORE_HPP

#include "Redis.hpp"
#include "RelayStore.hpp"

#include <memory>
#include <string>
#include <sw/redis++/redis++.h>

namespace LinkHelper {

/**
 * Relay store backed by a Redis server or cluster
 *
 * Transactions are MULTI/EXEC blocks. In cluster mode the routing key's hash
 * tag picks the node, so every key in one transaction must share the tag.
 * Redis errors are logged and rethrown unmodified; there are no retries.
 */
class RedisRelayStore : public RelayStore {
  public:
	explicit RedisRelayStore(const RedisConfig& rc);
	RedisRelayStore(std::shared_ptr<sw::redis::Redis> redis);
	RedisRelayStore(std::shared_ptr<sw::redis::RedisCluster> cluster);
	virtual ~RedisRelayStore();

	virtual std::unique_ptr<StoreTransaction> transaction(const std::string& routingKey) override;

  private:
	enum RedisMode { REDIS_MODE_STANDALONE, REDIS_MODE_CLUSTER };
	std::shared_ptr<sw::redis::Redis> _redis;
	std::shared_ptr<sw::redis::RedisCluster> _cluster;
	RedisMode _mode = REDIS_MODE_STANDALONE;
};

}	// namespace LinkHelper

#endif	 // LH_REDISRELAYSTORE_HPP
