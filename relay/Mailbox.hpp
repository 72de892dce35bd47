#ifndef LH_MAILBOX_HPP
#define LH_MAILBOX_HPP

#include "DeviceMessage.hpp"
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
 * Per-device expiring message queues, drained oldest first
 *
 * Delivery is at most once: a popped message is gone whether or not the
 * consumer processes it. Messages older than the message window are never
 * returned.
 */
class Mailbox {
  public:
	Mailbox(
		std::shared_ptr<RelayStore> store,
		const RelayKeys& keys,
		std::chrono::seconds messageWindow,
		long long defaultPullBatchSize,
		Clock clock = wallClockSeconds);
	Mailbox(std::shared_ptr<RelayStore> store, const RelayConfig& config, Clock clock = wallClockSeconds);
	~Mailbox();

	void pushMessage(
		const std::string& clientAddress,
		const std::string& deviceId,
		const DeviceMessage& message,
		double now);
	void pushMessage(const std::string& clientAddress, const std::string& deviceId, const DeviceMessage& message);

	/**
	 * Remove and return up to maxCount pending messages, oldest first
	 *
	 * Stored payloads that fail to parse are dropped. A maxCount of zero or
	 * less returns nothing and leaves the store untouched.
	 */
	std::vector<DeviceMessage> pullMessages(
		const std::string& clientAddress,
		const std::string& deviceId,
		long long maxCount,
		double now);
	std::vector<DeviceMessage>
	pullMessages(const std::string& clientAddress, const std::string& deviceId, long long maxCount);
	std::vector<DeviceMessage> pullMessages(const std::string& clientAddress, const std::string& deviceId);

	std::chrono::seconds messageWindow() const
	{
		return _messageWindow;
	}
	long long defaultPullBatchSize() const
	{
		return _defaultPullBatchSize;
	}

  private:
	std::shared_ptr<RelayStore> _store;
	RelayKeys _keys;
	std::chrono::seconds _messageWindow;
	long long _defaultPullBatchSize;
	Clock _clock;
};

}	// namespace LinkHelper

#endif	 // LH_MAILBOX_HPP
