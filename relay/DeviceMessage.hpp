#ifndef LH_DEVICEMESSAGE_HPP
#define LH_DEVICEMESSAGE_HPP

#include <nlohmann/json.hpp>
#include <string>

#define LH_MESSAGE_TYPE_MAX_LENGTH 64
#define LH_DEVICE_MESSAGE_FORMAT_VERSION 1

namespace LinkHelper {

/**
 * A typed unit of work addressed to one device
 *
 * Never mutated once stored. Two messages with identical fields serialize to
 * identical bytes, so a mailbox holds them as one entry when enqueued at the
 * same time; producers wanting distinct entries must vary the payload.
 */
class DeviceMessage {
  public:
	/**
	 * @throws ValidationError on invalid device_id, blank or long type, or non-object data
	 */
	DeviceMessage(const std::string& device_id, const std::string& type, const nlohmann::json& data);

	static DeviceMessage fromJson(const nlohmann::json& j);
	static DeviceMessage fromString(const std::string& raw);

	nlohmann::json toJson() const;
	std::string serialize() const;

	const std::string& deviceId() const
	{
		return _deviceId;
	}
	const std::string& type() const
	{
		return _type;
	}
	const nlohmann::json& data() const
	{
		return _data;
	}

	bool operator==(const DeviceMessage& other) const
	{
		return (_deviceId == other._deviceId) && (_type == other._type) && (_data == other._data);
	}
	bool operator!=(const DeviceMessage& other) const
	{
		return ! (*this == other);
	}

  private:
	std::string _deviceId;
	std::string _type;
	nlohmann::json _data;
};

}	// namespace LinkHelper

#endif	 // LH_DEVICEMESSAGE_HPP
