#ifndef LH_DEVICEINFO_HPP
#define LH_DEVICEINFO_HPP

#include <nlohmann/json.hpp>
#include <string>

#define LH_DEVICE_ID_LENGTH 32
#define LH_DEVICE_INFO_MAX_FIELD_LENGTH 253
#define LH_DEVICE_INFO_FORMAT_VERSION 1

namespace LinkHelper {

/**
 * Descriptive snapshot of a device, replaced wholesale on every heartbeat
 *
 * Construction validates field constraints and throws ValidationError naming
 * the first field that fails.
 */
class DeviceInfo {
  public:
	DeviceInfo(
		const std::string& device_id,
		const std::string& hostname,
		const std::string& os,
		const std::string& arch,
		const std::string& rpi_model,
		const std::string& octopi_version,
		const std::string& printerprofile);

	/**
	 * Parse and validate a JSON object
	 *
	 * String fields are trimmed before validation. A payload written by a
	 * newer format version is rejected.
	 *
	 * @throws ValidationError on missing or invalid fields
	 */
	static DeviceInfo fromJson(const nlohmann::json& j);

	/**
	 * @throws nlohmann::json::parse_error if raw is not JSON
	 * @throws ValidationError if it is JSON but not a valid DeviceInfo
	 */
	static DeviceInfo fromString(const std::string& raw);

	nlohmann::json toJson() const;

	/**
	 * @return Compact serialized form as stored
	 */
	std::string serialize() const;

	const std::string& deviceId() const
	{
		return _deviceId;
	}
	const std::string& hostname() const
	{
		return _hostname;
	}
	const std::string& os() const
	{
		return _os;
	}
	const std::string& arch() const
	{
		return _arch;
	}
	const std::string& rpiModel() const
	{
		return _rpiModel;
	}
	const std::string& octopiVersion() const
	{
		return _octopiVersion;
	}
	const std::string& printerProfile() const
	{
		return _printerProfile;
	}

	bool operator==(const DeviceInfo& other) const;
	bool operator!=(const DeviceInfo& other) const
	{
		return ! (*this == other);
	}

  private:
	std::string _deviceId;
	std::string _hostname;
	std::string _os;
	std::string _arch;
	std::string _rpiModel;
	std::string _octopiVersion;
	std::string _printerProfile;
};

/**
 * @throws ValidationError unless id is exactly LH_DEVICE_ID_LENGTH characters
 */
void validateDeviceId(const std::string& id);

/**
 * Fetch a required string field from a JSON object, trimmed
 *
 * @throws ValidationError if the field is missing or not a string
 */
std::string requiredJsonString(const nlohmann::json& j, const char* field);

/**
 * Check the "v" field of a stored payload
 *
 * @throws ValidationError if the payload claims a format newer than supported
 */
void checkFormatVersion(const nlohmann::json& j, int supported);

}	// namespace LinkHelper

#endif	 // LH_DEVICEINFO_HPP
