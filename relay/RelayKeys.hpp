#ifndef LH_RELAYKEYS_HPP
#define LH_RELAYKEYS_HPP

#include <string>

#define LH_DEFAULT_KEY_PREFIX "printer_discovery"

namespace LinkHelper {

/**
 * Store key naming for the relay
 *
 * All keys for one client address carry the address as a Redis Cluster hash
 * tag ({...}) so they map to one slot and may be written in one transaction.
 */
class RelayKeys {
  public:
	explicit RelayKeys(const std::string& prefix = LH_DEFAULT_KEY_PREFIX) : _prefix(prefix)
	{
	}

	/**
	 * Sorted set of device IDs scored by last heartbeat
	 */
	std::string presence(const std::string& clientAddress) const
	{
		return _clientPrefix(clientAddress) + "presence";
	}

	/**
	 * Serialized DeviceInfo snapshot for one device
	 */
	std::string deviceInfo(const std::string& clientAddress, const std::string& deviceId) const
	{
		return _clientPrefix(clientAddress) + "device_info:" + deviceId;
	}

	/**
	 * Sorted set of serialized DeviceMessages scored by enqueue time
	 */
	std::string messageQueue(const std::string& clientAddress, const std::string& deviceId) const
	{
		return _clientPrefix(clientAddress) + "messages_to:" + deviceId;
	}

	const std::string& prefix() const
	{
		return _prefix;
	}

	/**
	 * Client address as it appears between the braces of a key
	 *
	 * Braces inside the tag would move the cluster hash tag, so '{', '}' and
	 * the escape character '%' itself are percent-encoded. Any other address
	 * is returned unchanged.
	 */
	static std::string hashTag(const std::string& clientAddress)
	{
		std::string tag;
		tag.reserve(clientAddress.size());
		for (std::string::const_iterator c = clientAddress.begin(); c != clientAddress.end(); ++c) {
			switch (*c) {
				case '{':
					tag.append("%7B");
					break;
				case '}':
					tag.append("%7D");
					break;
				case '%':
					tag.append("%25");
					break;
				default:
					tag.push_back(*c);
					break;
			}
		}
		return tag;
	}

  private:
	std::string _clientPrefix(const std::string& clientAddress) const
	{
		return _prefix + ":{" + hashTag(clientAddress) + "}:";
	}

	std::string _prefix;
};

}	// namespace LinkHelper

#endif	 // LH_RELAYKEYS_HPP
