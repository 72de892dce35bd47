#include "MemoryRelayStore.hpp"

#include "../node/Metrics.hpp"
#include "RelayErrors.hpp"

#include <cstdio>

namespace LinkHelper {

class MemoryStoreTransaction : public StoreTransaction {
  public:
	explicit MemoryStoreTransaction(MemoryRelayStore* store) : _store(store), _executed(false)
	{
	}

	virtual StoreTransaction& zadd(const std::string& key, const std::string& member, double score) override
	{
		MemoryRelayStore* s = _store;
		return _queue(key, [s, key, member, score](StoreReply&) { s->_zadd(key, member, score); });
	}

	virtual StoreTransaction& zremrangebyscore(const std::string& key, double maxScore) override
	{
		MemoryRelayStore* s = _store;
		return _queue(key, [s, key, maxScore](StoreReply&) { s->_zremrangebyscore(key, maxScore); });
	}

	virtual StoreTransaction& zrangebyscore(const std::string& key, double minScore) override
	{
		MemoryRelayStore* s = _store;
		return _queue(key, [s, key, minScore](StoreReply& r) { s->_zrangebyscore(key, minScore, r); });
	}

	virtual StoreTransaction& zpopmin(const std::string& key, long long count) override
	{
		MemoryRelayStore* s = _store;
		return _queue(key, [s, key, count](StoreReply& r) { s->_zpopmin(key, count, r); });
	}

	virtual StoreTransaction& expire(const std::string& key, std::chrono::seconds ttl) override
	{
		MemoryRelayStore* s = _store;
		return _queue(key, [s, key, ttl](StoreReply&) { s->_expire(key, ttl); });
	}

	virtual StoreTransaction& get(const std::string& key) override
	{
		MemoryRelayStore* s = _store;
		return _queue(key, [s, key](StoreReply& r) { s->_get(key, r); });
	}

	virtual StoreTransaction& setex(const std::string& key, std::chrono::seconds ttl, const std::string& value) override
	{
		MemoryRelayStore* s = _store;
		return _queue(key, [s, key, ttl, value](StoreReply&) { s->_setex(key, ttl, value); });
	}

	virtual StoreReplies exec() override
	{
		if (_executed) {
			throw StoreError("transaction already executed");
		}
		_executed = true;
		return _store->_exec(_keys, _ops);
	}

  private:
	StoreTransaction& _queue(const std::string& key, MemoryRelayStore::_Op op)
	{
		_keys.push_back(key);
		_ops.push_back(op);
		return *this;
	}

	MemoryRelayStore* _store;
	std::vector<std::string> _keys;
	std::vector<MemoryRelayStore::_Op> _ops;
	bool _executed;
};

MemoryRelayStore::MemoryRelayStore(Clock clock) : _clock(clock)
{
}

MemoryRelayStore::~MemoryRelayStore()
{
}

std::unique_ptr<StoreTransaction> MemoryRelayStore::transaction(const std::string& /* routingKey unused */)
{
	return std::unique_ptr<StoreTransaction>(new MemoryStoreTransaction(this));
}

bool MemoryRelayStore::exists(const std::string& key)
{
	std::lock_guard<std::mutex> l(_lock);
	return (_find(key) != nullptr);
}

std::size_t MemoryRelayStore::keyCount()
{
	std::lock_guard<std::mutex> l(_lock);
	_purgeExpired();
	return _entries.size();
}

StoreReplies MemoryRelayStore::_exec(const std::vector<std::string>& keys, const std::vector<_Op>& ops)
{
	std::lock_guard<std::mutex> l(_lock);
	Metrics::store_transactions++;

	// saved so a failing operation leaves no partial effects behind
	std::map<std::string, _Entry> saved;
	std::set<std::string> missing;
	for (std::vector<std::string>::const_iterator k = keys.begin(); k != keys.end(); ++k) {
		std::map<std::string, _Entry>::const_iterator e = _entries.find(*k);
		if (e == _entries.end()) {
			missing.insert(*k);
		}
		else {
			saved[*k] = e->second;
		}
	}

	StoreReplies replies(ops.size());
	try {
		for (std::size_t i = 0; i < ops.size(); ++i) {
			ops[i](replies[i]);
		}
	}
	catch (const StoreError& e) {
		for (std::map<std::string, _Entry>::iterator s = saved.begin(); s != saved.end(); ++s) {
			_entries[s->first] = s->second;
		}
		for (std::set<std::string>::const_iterator m = missing.begin(); m != missing.end(); ++m) {
			_entries.erase(*m);
		}
		Metrics::store_errors++;
		fprintf(stderr, "Memory store transaction failed: %s\n", e.what());
		throw;
	}
	return replies;
}

MemoryRelayStore::_Entry* MemoryRelayStore::_find(const std::string& key)
{
	std::map<std::string, _Entry>::iterator e = _entries.find(key);
	if (e == _entries.end()) {
		return nullptr;
	}
	if ((e->second.expiresAt > 0.0) && (_clock() >= e->second.expiresAt)) {
		_entries.erase(e);
		return nullptr;
	}
	return &(e->second);
}

MemoryRelayStore::_Entry* MemoryRelayStore::_findSortedSet(const std::string& key)
{
	_Entry* e = _find(key);
	if ((e) && (! e->sortedSet)) {
		throw StoreError("WRONGTYPE " + key + " holds a string, not a sorted set");
	}
	return e;
}

void MemoryRelayStore::_purgeExpired()
{
	const double now = _clock();
	for (std::map<std::string, _Entry>::iterator e = _entries.begin(); e != _entries.end();) {
		if ((e->second.expiresAt > 0.0) && (now >= e->second.expiresAt)) {
			_entries.erase(e++);
		}
		else {
			++e;
		}
	}
}

void MemoryRelayStore::_zadd(const std::string& key, const std::string& member, double score)
{
	_Entry* e = _findSortedSet(key);
	if (! e) {
		e = &(_entries[key]);
		e->sortedSet = true;
	}
	std::unordered_map<std::string, double>::iterator old = e->scores.find(member);
	if (old != e->scores.end()) {
		e->byScore.erase(std::make_pair(old->second, member));
		old->second = score;
	}
	else {
		e->scores[member] = score;
	}
	e->byScore.insert(std::make_pair(score, member));
}

void MemoryRelayStore::_zremrangebyscore(const std::string& key, double maxScore)
{
	_Entry* e = _findSortedSet(key);
	if (! e) {
		return;
	}
	std::set<std::pair<double, std::string> >::iterator i = e->byScore.begin();
	while ((i != e->byScore.end()) && (i->first <= maxScore)) {
		e->scores.erase(i->second);
		e->byScore.erase(i++);
	}
	if (e->byScore.empty()) {
		_entries.erase(key);
	}
}

void MemoryRelayStore::_zrangebyscore(const std::string& key, double minScore, StoreReply& reply)
{
	_Entry* e = _findSortedSet(key);
	if (! e) {
		return;
	}
	std::set<std::pair<double, std::string> >::const_iterator i =
		e->byScore.lower_bound(std::make_pair(minScore, std::string()));
	for (; i != e->byScore.end(); ++i) {
		reply.members.push_back(i->second);
	}
}

void MemoryRelayStore::_zpopmin(const std::string& key, long long count, StoreReply& reply)
{
	_Entry* e = _findSortedSet(key);
	if (! e) {
		return;
	}
	while ((count > 0) && (! e->byScore.empty())) {
		std::set<std::pair<double, std::string> >::iterator i = e->byScore.begin();
		reply.scored.push_back(std::make_pair(i->second, i->first));
		e->scores.erase(i->second);
		e->byScore.erase(i);
		--count;
	}
	if (e->byScore.empty()) {
		_entries.erase(key);
	}
}

void MemoryRelayStore::_expire(const std::string& key, std::chrono::seconds ttl)
{
	_Entry* e = _find(key);
	if (! e) {
		return;
	}
	if (ttl.count() <= 0) {
		_entries.erase(key);
		return;
	}
	e->expiresAt = _clock() + (double)ttl.count();
}

void MemoryRelayStore::_get(const std::string& key, StoreReply& reply)
{
	_Entry* e = _find(key);
	if (! e) {
		return;
	}
	if (e->sortedSet) {
		throw StoreError("WRONGTYPE " + key + " holds a sorted set, not a string");
	}
	reply.value = e->value;
}

void MemoryRelayStore::_setex(const std::string& key, std::chrono::seconds ttl, const std::string& value)
{
	if (ttl.count() <= 0) {
		throw StoreError("invalid expire time for " + key);
	}
	_Entry e;
	e.value = value;
	e.expiresAt = _clock() + (double)ttl.count();
	_entries[key] = e;
}

}	// namespace LinkHelper
