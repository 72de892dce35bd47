#include "DeviceMessage.hpp"

#include "../osdep/OSUtils.hpp"
#include "DeviceInfo.hpp"
#include "RelayErrors.hpp"
#include "RelayUtil.hpp"

namespace LinkHelper {

DeviceMessage::DeviceMessage(const std::string& device_id, const std::string& type, const nlohmann::json& data)
	: _deviceId(device_id)
	, _type(type)
	, _data(data)
{
	validateDeviceId(_deviceId);
	if (trim(_type).empty()) {
		throw ValidationError("type", "may not be blank");
	}
	if (utf8Length(_type) > LH_MESSAGE_TYPE_MAX_LENGTH) {
		throw ValidationError("type", "must be at most " + std::to_string(LH_MESSAGE_TYPE_MAX_LENGTH) + " characters");
	}
	if (! _data.is_object()) {
		throw ValidationError("data", "must be a JSON object");
	}
}

DeviceMessage DeviceMessage::fromJson(const nlohmann::json& j)
{
	if (! j.is_object()) {
		throw ValidationError("device_message", "must be a JSON object");
	}
	checkFormatVersion(j, LH_DEVICE_MESSAGE_FORMAT_VERSION);

	std::string device_id = requiredJsonString(j, "device_id");
	std::string type = requiredJsonString(j, "type");
	nlohmann::json::const_iterator data = j.find("data");
	if (data == j.end()) {
		throw ValidationError("data", "is required");
	}
	return DeviceMessage(device_id, type, *data);
}

DeviceMessage DeviceMessage::fromString(const std::string& raw)
{
	return fromJson(nlohmann::json::parse(raw));
}

nlohmann::json DeviceMessage::toJson() const
{
	nlohmann::json j;
	j["v"] = LH_DEVICE_MESSAGE_FORMAT_VERSION;
	j["device_id"] = _deviceId;
	j["type"] = _type;
	j["data"] = _data;
	return j;
}

std::string DeviceMessage::serialize() const
{
	return OSUtils::jsonDump(toJson(), -1);
}

}	// namespace LinkHelper
