#include "PresenceRegistry.hpp"

#include "../node/Metrics.hpp"
#include "RelayConfig.hpp"
#include "RelayErrors.hpp"

#include <cstdio>
#include <opentelemetry/trace/provider.h>

namespace LinkHelper {

PresenceRegistry::PresenceRegistry(
	std::shared_ptr<RelayStore> store,
	const RelayKeys& keys,
	std::chrono::seconds presenceWindow,
	Clock clock)
	: _store(store)
	, _keys(keys)
	, _presenceWindow(presenceWindow)
	, _clock(clock)
{
}

PresenceRegistry::PresenceRegistry(std::shared_ptr<RelayStore> store, const RelayConfig& config, Clock clock)
	: PresenceRegistry(store, RelayKeys(config.keyPrefix), config.presenceWindow, clock)
{
}

PresenceRegistry::~PresenceRegistry()
{
}

void PresenceRegistry::updatePresence(
	const std::string& clientAddress,
	const std::string& deviceId,
	const DeviceInfo& info,
	double now)
{
	auto provider = opentelemetry::trace::Provider::GetTracerProvider();
	auto tracer = provider->GetTracer("PresenceRegistry");
	auto span = tracer->StartSpan("PresenceRegistry::updatePresence");
	auto scope = tracer->WithActiveSpan(span);

	const std::string presenceKey = _keys.presence(clientAddress);
	auto tx = _store->transaction(presenceKey);
	tx->zadd(presenceKey, deviceId, now)
		.expire(presenceKey, _presenceWindow)
		.setex(_keys.deviceInfo(clientAddress, deviceId), _presenceWindow, info.serialize());
	tx->exec();
	Metrics::presence_update++;

#ifdef LH_TRACE
	fprintf(stderr, "presence: %s seen at %s (%.3f)\n", deviceId.c_str(), clientAddress.c_str(), now);
#endif
}

void PresenceRegistry::updatePresence(const std::string& clientAddress, const std::string& deviceId, const DeviceInfo& info)
{
	updatePresence(clientAddress, deviceId, info, _clock());
}

std::vector<DeviceInfo> PresenceRegistry::listActiveDevices(const std::string& clientAddress, double now)
{
	auto provider = opentelemetry::trace::Provider::GetTracerProvider();
	auto tracer = provider->GetTracer("PresenceRegistry");
	auto span = tracer->StartSpan("PresenceRegistry::listActiveDevices");
	auto scope = tracer->WithActiveSpan(span);

	Metrics::presence_list++;

	const std::string presenceKey = _keys.presence(clientAddress);
	const double cutoff = expiryCutoff(now, _presenceWindow);

	std::vector<std::string> deviceIds;
	{
		auto tx = _store->transaction(presenceKey);
		tx->zremrangebyscore(presenceKey, cutoff).zrangebyscore(presenceKey, cutoff);
		StoreReplies r = tx->exec();
		deviceIds.swap(r[1].members);
	}

	std::vector<DeviceInfo> devices;
	if (deviceIds.empty()) {
		return devices;
	}

	StoreReplies snapshots;
	{
		auto tx = _store->transaction(presenceKey);
		for (const auto& id : deviceIds) {
			tx->get(_keys.deviceInfo(clientAddress, id));
		}
		snapshots = tx->exec();
	}

	devices.reserve(snapshots.size());
	for (std::size_t i = 0; i < snapshots.size(); ++i) {
		// snapshot may have expired since the presence set was read
		if (! snapshots[i].value) {
			Metrics::presence_info_skipped++;
			continue;
		}
		try {
			devices.push_back(DeviceInfo::fromString(*(snapshots[i].value)));
		}
		catch (const nlohmann::json::exception& e) {
			Metrics::presence_info_skipped++;
			fprintf(stderr, "JSON parse error in snapshot for %s: %s\n", deviceIds[i].c_str(), e.what());
		}
		catch (const ValidationError& e) {
			Metrics::presence_info_skipped++;
			fprintf(stderr, "Invalid snapshot for %s: %s\n", deviceIds[i].c_str(), e.what());
		}
	}

	span->SetAttribute("device_count", (int64_t)devices.size());
	return devices;
}

std::vector<DeviceInfo> PresenceRegistry::listActiveDevices(const std::string& clientAddress)
{
	return listActiveDevices(clientAddress, _clock());
}

}	// namespace LinkHelper
