#ifndef LH_MEMORYRELAYSTORE_HPP
#define LH_MEMORYRELAYSTORE_HPP

#include "RelayStore.hpp"
#include "RelayUtil.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace LinkHelper {

/**
 * In-process store with the same semantics as the Redis commands the relay uses
 *
 * Every exec() runs under one lock, so transactions are serialized and never
 * observed half applied; if an operation fails the keys touched by the
 * transaction are restored before the error propagates. Keys expire lazily
 * against the injected clock.
 */
class MemoryRelayStore : public RelayStore {
	friend class MemoryStoreTransaction;

  public:
	explicit MemoryRelayStore(Clock clock = wallClockSeconds);
	virtual ~MemoryRelayStore();

	virtual std::unique_ptr<StoreTransaction> transaction(const std::string& routingKey) override;

	/**
	 * @return True if key exists and has not expired
	 */
	bool exists(const std::string& key);

	/**
	 * @return Number of live keys
	 */
	std::size_t keyCount();

  private:
	struct _Entry {
		bool sortedSet;
		std::string value;
		std::unordered_map<std::string, double> scores;
		std::set<std::pair<double, std::string> > byScore;
		double expiresAt;	// 0 if persistent

		_Entry() : sortedSet(false), expiresAt(0.0)
		{
		}
	};

	typedef std::function<void(StoreReply&)> _Op;

	StoreReplies _exec(const std::vector<std::string>& keys, const std::vector<_Op>& ops);

	// all of the below require _lock to be held
	_Entry* _find(const std::string& key);
	_Entry* _findSortedSet(const std::string& key);
	void _purgeExpired();

	void _zadd(const std::string& key, const std::string& member, double score);
	void _zremrangebyscore(const std::string& key, double maxScore);
	void _zrangebyscore(const std::string& key, double minScore, StoreReply& reply);
	void _zpopmin(const std::string& key, long long count, StoreReply& reply);
	void _expire(const std::string& key, std::chrono::seconds ttl);
	void _get(const std::string& key, StoreReply& reply);
	void _setex(const std::string& key, std::chrono::seconds ttl, const std::string& value);

	Clock _clock;
	std::mutex _lock;
	std::map<std::string, _Entry> _entries;
};

}	// namespace LinkHelper

#endif	 // LH_MEMORYRELAYSTORE_HPP
