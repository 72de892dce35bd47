#include "RedisRelayStore.hpp"

#include "../node/Metrics.hpp"
#include "RelayUtil.hpp"

#include <chrono>
#include <cstdio>
#include <iterator>
#include <vector>

namespace LinkHelper {

namespace {

class RedisStoreTransaction : public StoreTransaction {
  public:
	explicit RedisStoreTransaction(sw::redis::Transaction tx) : _tx(std::move(tx))
	{
	}

	virtual StoreTransaction& zadd(const std::string& key, const std::string& member, double score) override
	{
		_tx.zadd(key, member, score);
		_kinds.push_back(REPLY_NONE);
		return *this;
	}

	virtual StoreTransaction& zremrangebyscore(const std::string& key, double maxScore) override
	{
		_tx.zremrangebyscore(
			key, sw::redis::RightBoundedInterval<double>(maxScore, sw::redis::BoundType::LEFT_OPEN));
		_kinds.push_back(REPLY_NONE);
		return *this;
	}

	virtual StoreTransaction& zrangebyscore(const std::string& key, double minScore) override
	{
		_tx.zrangebyscore(key, sw::redis::LeftBoundedInterval<double>(minScore, sw::redis::BoundType::RIGHT_OPEN));
		_kinds.push_back(REPLY_MEMBERS);
		return *this;
	}

	virtual StoreTransaction& zpopmin(const std::string& key, long long count) override
	{
		_tx.zpopmin(key, count);
		_kinds.push_back(REPLY_SCORED);
		return *this;
	}

	virtual StoreTransaction& expire(const std::string& key, std::chrono::seconds ttl) override
	{
		_tx.expire(key, ttl);
		_kinds.push_back(REPLY_NONE);
		return *this;
	}

	virtual StoreTransaction& get(const std::string& key) override
	{
		_tx.get(key);
		_kinds.push_back(REPLY_VALUE);
		return *this;
	}

	virtual StoreTransaction& setex(const std::string& key, std::chrono::seconds ttl, const std::string& value) override
	{
		_tx.setex(key, ttl, value);
		_kinds.push_back(REPLY_NONE);
		return *this;
	}

	virtual StoreReplies exec() override
	{
		StoreReplies out(_kinds.size());
		try {
			auto replies = _tx.exec();
			Metrics::store_transactions++;
			for (std::size_t i = 0; i < _kinds.size(); ++i) {
				switch (_kinds[i]) {
					case REPLY_VALUE: {
						sw::redis::OptionalString v = replies.get<sw::redis::OptionalString>(i);
						if (v) {
							out[i].value = *v;
						}
					} break;
					case REPLY_MEMBERS:
						replies.get(i, std::back_inserter(out[i].members));
						break;
					case REPLY_SCORED:
						replies.get(i, std::back_inserter(out[i].scored));
						break;
					case REPLY_NONE:
						break;
				}
			}
		}
		catch (const sw::redis::Error& e) {
			Metrics::store_errors++;
			fprintf(stderr, "Error executing Redis transaction: %s\n", e.what());
			throw;
		}
		return out;
	}

  private:
	enum ReplyKind { REPLY_NONE, REPLY_VALUE, REPLY_MEMBERS, REPLY_SCORED };

	sw::redis::Transaction _tx;
	std::vector<ReplyKind> _kinds;
};

}	// anonymous namespace

RedisRelayStore::RedisRelayStore(const RedisConfig& rc)
{
	sw::redis::ConnectionOptions opts;
	sw::redis::ConnectionPoolOptions poolOpts;
	opts.host = rc.hostname;
	opts.port = rc.port;
	opts.password = rc.password;
	opts.db = 0;
	opts.keep_alive = true;
	opts.connect_timeout = std::chrono::seconds(3);
	opts.socket_timeout = std::chrono::seconds(3);
	poolOpts.size = 25;
	poolOpts.wait_timeout = std::chrono::seconds(5);
	poolOpts.connection_lifetime = std::chrono::minutes(5);
	if (rc.clusterMode) {
		fprintf(stderr, "%s: Using Redis in Cluster Mode at %s:%d\n", _timestr(), rc.hostname.c_str(), rc.port);
		_cluster = std::make_shared<sw::redis::RedisCluster>(opts, poolOpts);
		_mode = REDIS_MODE_CLUSTER;
	}
	else {
		fprintf(stderr, "%s: Using Redis in Standalone Mode at %s:%d\n", _timestr(), rc.hostname.c_str(), rc.port);
		_redis = std::make_shared<sw::redis::Redis>(opts, poolOpts);
		_mode = REDIS_MODE_STANDALONE;
	}
}

RedisRelayStore::RedisRelayStore(std::shared_ptr<sw::redis::Redis> redis) : _redis(redis), _mode(REDIS_MODE_STANDALONE)
{
}

RedisRelayStore::RedisRelayStore(std::shared_ptr<sw::redis::RedisCluster> cluster)
	: _cluster(cluster)
	, _mode(REDIS_MODE_CLUSTER)
{
}

RedisRelayStore::~RedisRelayStore()
{
}

std::unique_ptr<StoreTransaction> RedisRelayStore::transaction(const std::string& routingKey)
{
	try {
		if (_mode == REDIS_MODE_CLUSTER) {
			return std::unique_ptr<StoreTransaction>(
				new RedisStoreTransaction(_cluster->transaction(routingKey, true, false)));
		}
		return std::unique_ptr<StoreTransaction>(new RedisStoreTransaction(_redis->transaction(true, false)));
	}
	catch (const sw::redis::Error& e) {
		Metrics::store_errors++;
		fprintf(stderr, "Error opening Redis transaction: %s\n", e.what());
		throw;
	}
}

}	// namespace LinkHelper
