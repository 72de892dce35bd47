#ifndef LH_PRESENCEREGISTRY_HPP
#define LH_PRESENCEREGISTRY_HPP

#include "DeviceInfo.hpp"
#include "RelayKeys.hpp"
#include "RelayStore.hpp"
#include "RelayUtil.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace LinkHelper {

struct RelayConfig;

/**
 * Tracks which devices have been seen recently under each client address
 *
 * Holds no state of its own; everything lives in the store and every
 * mutation is a single store transaction, so any number of registries in any
 * number of processes may share one store.
 *
 * A heartbeat always overwrites the recorded score, even if the supplied time
 * is older than the one already stored. Callers should supply monotonic times.
 */
class PresenceRegistry {
  public:
	PresenceRegistry(
		std::shared_ptr<RelayStore> store,
		const RelayKeys& keys,
		std::chrono::seconds presenceWindow,
		Clock clock = wallClockSeconds);
	PresenceRegistry(std::shared_ptr<RelayStore> store, const RelayConfig& config, Clock clock = wallClockSeconds);
	~PresenceRegistry();

	/**
	 * Record a heartbeat and replace the device's snapshot
	 *
	 * Marks the device present with score now, refreshes the presence set's
	 * expiration and stores the snapshot with a TTL of the presence window,
	 * all in one transaction.
	 */
	void updatePresence(const std::string& clientAddress, const std::string& deviceId, const DeviceInfo& info, double now);
	void updatePresence(const std::string& clientAddress, const std::string& deviceId, const DeviceInfo& info);

	/**
	 * Snapshots of every device seen within the presence window
	 *
	 * Devices whose snapshot has expired or cannot be parsed are left out.
	 * Result order is unspecified.
	 */
	std::vector<DeviceInfo> listActiveDevices(const std::string& clientAddress, double now);
	std::vector<DeviceInfo> listActiveDevices(const std::string& clientAddress);

	std::chrono::seconds presenceWindow() const
	{
		return _presenceWindow;
	}

  private:
	std::shared_ptr<RelayStore> _store;
	RelayKeys _keys;
	std::chrono::seconds _presenceWindow;
	Clock _clock;
};

}	// namespace LinkHelper

#endif	 // LH_PRESENCEREGISTRY_HPP
