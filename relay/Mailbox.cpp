#include "Mailbox.hpp"

#include "../node/Metrics.hpp"
#include "RelayConfig.hpp"
#include "RelayErrors.hpp"

#include <cstdio>
#include <opentelemetry/trace/provider.h>

namespace LinkHelper {

Mailbox::Mailbox(
	std::shared_ptr<RelayStore> store,
	const RelayKeys& keys,
	std::chrono::seconds messageWindow,
	long long defaultPullBatchSize,
	Clock clock)
	: _store(store)
	, _keys(keys)
	, _messageWindow(messageWindow)
	, _defaultPullBatchSize(defaultPullBatchSize)
	, _clock(clock)
{
}

Mailbox::Mailbox(std::shared_ptr<RelayStore> store, const RelayConfig& config, Clock clock)
	: Mailbox(store, RelayKeys(config.keyPrefix), config.messageWindow, config.defaultPullBatchSize, clock)
{
}

Mailbox::~Mailbox()
{
}

void Mailbox::pushMessage(
	const std::string& clientAddress,
	const std::string& deviceId,
	const DeviceMessage& message,
	double now)
{
	auto provider = opentelemetry::trace::Provider::GetTracerProvider();
	auto tracer = provider->GetTracer("Mailbox");
	auto span = tracer->StartSpan("Mailbox::pushMessage");
	auto scope = tracer->WithActiveSpan(span);

	const std::string key = _keys.messageQueue(clientAddress, deviceId);
	auto tx = _store->transaction(key);
	tx->zremrangebyscore(key, expiryCutoff(now, _messageWindow))
		.zadd(key, message.serialize(), now)
		.expire(key, _messageWindow);
	tx->exec();
	Metrics::message_push++;

#ifdef LH_TRACE
	fprintf(
		stderr, "mailbox: queued %s message for %s at %s (%.3f)\n", message.type().c_str(), deviceId.c_str(),
		clientAddress.c_str(), now);
#endif
}

void Mailbox::pushMessage(const std::string& clientAddress, const std::string& deviceId, const DeviceMessage& message)
{
	pushMessage(clientAddress, deviceId, message, _clock());
}

std::vector<DeviceMessage> Mailbox::pullMessages(
	const std::string& clientAddress,
	const std::string& deviceId,
	long long maxCount,
	double now)
{
	std::vector<DeviceMessage> messages;
	if (maxCount <= 0) {
		return messages;
	}

	auto provider = opentelemetry::trace::Provider::GetTracerProvider();
	auto tracer = provider->GetTracer("Mailbox");
	auto span = tracer->StartSpan("Mailbox::pullMessages");
	auto scope = tracer->WithActiveSpan(span);

	const std::string key = _keys.messageQueue(clientAddress, deviceId);
	StoreReplies r;
	{
		auto tx = _store->transaction(key);
		tx->zremrangebyscore(key, expiryCutoff(now, _messageWindow)).zpopmin(key, maxCount);
		r = tx->exec();
	}
	Metrics::message_pull++;

	const std::vector<std::pair<std::string, double> >& popped = r[1].scored;
	messages.reserve(popped.size());
	for (const auto& p : popped) {
		try {
			messages.push_back(DeviceMessage::fromString(p.first));
			Metrics::message_delivered++;
		}
		catch (const nlohmann::json::exception& e) {
			Metrics::message_malformed++;
			fprintf(stderr, "JSON parse error in message for %s: %s\n", deviceId.c_str(), e.what());
		}
		catch (const ValidationError& e) {
			Metrics::message_malformed++;
			fprintf(stderr, "Invalid message for %s: %s\n", deviceId.c_str(), e.what());
		}
	}

	span->SetAttribute("message_count", (int64_t)messages.size());
	return messages;
}

std::vector<DeviceMessage>
Mailbox::pullMessages(const std::string& clientAddress, const std::string& deviceId, long long maxCount)
{
	return pullMessages(clientAddress, deviceId, maxCount, _clock());
}

std::vector<DeviceMessage> Mailbox::pullMessages(const std::string& clientAddress, const std::string& deviceId)
{
	return pullMessages(clientAddress, deviceId, _defaultPullBatchSize, _clock());
}

}	// namespace LinkHelper
