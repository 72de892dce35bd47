#include "DeviceInfo.hpp"

#include "../osdep/OSUtils.hpp"
#include "RelayErrors.hpp"
#include "RelayUtil.hpp"

namespace LinkHelper {

namespace {

void checkMaxLength(const char* field, const std::string& value, std::size_t maxLength)
{
	if (utf8Length(value) > maxLength) {
		throw ValidationError(field, "must be at most " + std::to_string(maxLength) + " characters");
	}
}

}	// anonymous namespace

void validateDeviceId(const std::string& id)
{
	if (utf8Length(id) != LH_DEVICE_ID_LENGTH) {
		throw ValidationError("device_id", "must be exactly " + std::to_string(LH_DEVICE_ID_LENGTH) + " characters");
	}
}

std::string requiredJsonString(const nlohmann::json& j, const char* field)
{
	nlohmann::json::const_iterator f = j.find(field);
	if (f == j.end()) {
		throw ValidationError(field, "is required");
	}
	if (f->is_null()) {
		throw ValidationError(field, "may not be null");
	}
	if (! f->is_string()) {
		throw ValidationError(field, "must be a string");
	}
	return trim(f->get<std::string>());
}

void checkFormatVersion(const nlohmann::json& j, int supported)
{
	nlohmann::json::const_iterator v = j.find("v");
	if (v == j.end()) {
		return;
	}
	if ((! v->is_number_integer()) || (v->get<int64_t>() < 1)) {
		throw ValidationError("v", "must be a positive integer");
	}
	if (v->get<int64_t>() > supported) {
		throw ValidationError("v", "format version " + std::to_string(v->get<int64_t>()) + " is not supported");
	}
}

DeviceInfo::DeviceInfo(
	const std::string& device_id,
	const std::string& hostname,
	const std::string& os,
	const std::string& arch,
	const std::string& rpi_model,
	const std::string& octopi_version,
	const std::string& printerprofile)
	: _deviceId(device_id)
	, _hostname(hostname)
	, _os(os)
	, _arch(arch)
	, _rpiModel(rpi_model)
	, _octopiVersion(octopi_version)
	, _printerProfile(printerprofile)
{
	validateDeviceId(_deviceId);
	if (trim(_hostname).empty()) {
		throw ValidationError("hostname", "may not be blank");
	}
	checkMaxLength("hostname", _hostname, LH_DEVICE_INFO_MAX_FIELD_LENGTH);
	checkMaxLength("os", _os, LH_DEVICE_INFO_MAX_FIELD_LENGTH);
	checkMaxLength("arch", _arch, LH_DEVICE_INFO_MAX_FIELD_LENGTH);
	checkMaxLength("rpi_model", _rpiModel, LH_DEVICE_INFO_MAX_FIELD_LENGTH);
	checkMaxLength("octopi_version", _octopiVersion, LH_DEVICE_INFO_MAX_FIELD_LENGTH);
	checkMaxLength("printerprofile", _printerProfile, LH_DEVICE_INFO_MAX_FIELD_LENGTH);
}

DeviceInfo DeviceInfo::fromJson(const nlohmann::json& j)
{
	if (! j.is_object()) {
		throw ValidationError("device_info", "must be a JSON object");
	}
	checkFormatVersion(j, LH_DEVICE_INFO_FORMAT_VERSION);

	// evaluated in field order so the first violation is the one reported
	std::string device_id = requiredJsonString(j, "device_id");
	std::string hostname = requiredJsonString(j, "hostname");
	std::string os = requiredJsonString(j, "os");
	std::string arch = requiredJsonString(j, "arch");
	std::string rpi_model = requiredJsonString(j, "rpi_model");
	std::string octopi_version = requiredJsonString(j, "octopi_version");
	std::string printerprofile = requiredJsonString(j, "printerprofile");
	return DeviceInfo(device_id, hostname, os, arch, rpi_model, octopi_version, printerprofile);
}

DeviceInfo DeviceInfo::fromString(const std::string& raw)
{
	return fromJson(nlohmann::json::parse(raw));
}

nlohmann::json DeviceInfo::toJson() const
{
	nlohmann::json j;
	j["v"] = LH_DEVICE_INFO_FORMAT_VERSION;
	j["device_id"] = _deviceId;
	j["hostname"] = _hostname;
	j["os"] = _os;
	j["arch"] = _arch;
	j["rpi_model"] = _rpiModel;
	j["octopi_version"] = _octopiVersion;
	j["printerprofile"] = _printerProfile;
	return j;
}

std::string DeviceInfo::serialize() const
{
	return OSUtils::jsonDump(toJson(), -1);
}

bool DeviceInfo::operator==(const DeviceInfo& other) const
{
	return (_deviceId == other._deviceId) && (_hostname == other._hostname) && (_os == other._os)
		   && (_arch == other._arch) && (_rpiModel == other._rpiModel) && (_octopiVersion == other._octopiVersion)
		   && (_printerProfile == other._printerProfile);
}

}	// namespace LinkHelper
