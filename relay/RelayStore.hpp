#ifndef LH_RELAYSTORE_HPP
#define LH_RELAYSTORE_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace LinkHelper {

struct RelayConfig;

/**
 * Result of one queued store operation
 *
 * Only the field matching the operation is filled in: value for get(),
 * members for zrangebyscore(), scored for zpopmin(). Write operations leave
 * every field empty.
 */
struct StoreReply {
	std::optional<std::string> value;
	std::vector<std::string> members;
	std::vector<std::pair<std::string, double> > scored;
};

typedef std::vector<StoreReply> StoreReplies;

/**
 * A group of store operations applied as one atomically visible unit
 *
 * Operations are queued by the chaining methods and applied by exec(), which
 * returns one reply per queued operation in queue order. A transaction is
 * executed at most once.
 */
class StoreTransaction {
  public:
	virtual ~StoreTransaction() = default;

	/**
	 * Add member to sorted set key, or update its score if present
	 */
	virtual StoreTransaction& zadd(const std::string& key, const std::string& member, double score) = 0;

	/**
	 * Remove members with score in (-inf, maxScore]
	 */
	virtual StoreTransaction& zremrangebyscore(const std::string& key, double maxScore) = 0;

	/**
	 * Members with score in [minScore, +inf), lowest score first
	 */
	virtual StoreTransaction& zrangebyscore(const std::string& key, double minScore) = 0;

	/**
	 * Remove and return up to count lowest-scored members, lowest first
	 */
	virtual StoreTransaction& zpopmin(const std::string& key, long long count) = 0;

	/**
	 * Set or refresh the time to live of an existing key
	 */
	virtual StoreTransaction& expire(const std::string& key, std::chrono::seconds ttl) = 0;

	virtual StoreTransaction& get(const std::string& key) = 0;

	virtual StoreTransaction& setex(const std::string& key, std::chrono::seconds ttl, const std::string& value) = 0;

	virtual StoreReplies exec() = 0;
};

/**
 * Abstract expiring key/value store backing the relay
 *
 * Implementations might talk to Redis or keep everything in process memory.
 */
class RelayStore {
  public:
	virtual ~RelayStore() = default;

	/**
	 * Begin a transaction
	 *
	 * @param routingKey Any key the transaction touches; used to pick the shard in clustered stores
	 */
	virtual std::unique_ptr<StoreTransaction> transaction(const std::string& routingKey) = 0;
};

/**
 * Construct the store backend selected by configuration
 *
 * Called once at process start; the result is shared by every subsystem.
 */
std::shared_ptr<RelayStore> makeRelayStore(const RelayConfig& config);

}	// namespace LinkHelper

#endif	 // LH_RELAYSTORE_HPP
