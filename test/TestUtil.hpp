#ifndef LH_TEST_TESTUTIL_HPP
#define LH_TEST_TESTUTIL_HPP

#include "relay/DeviceInfo.hpp"
#include "relay/DeviceMessage.hpp"
#include "relay/RelayUtil.hpp"

#include <string>

namespace LinkHelper {
namespace Test {

/**
 * Manually advanced time source shared by a store and the relay under test
 */
struct FakeClock {
	double t = 0.0;

	Clock clock()
	{
		return [this]() { return t; };
	}
};

inline std::string deviceId(char c)
{
	return std::string(LH_DEVICE_ID_LENGTH, c);
}

inline DeviceInfo makeInfo(const std::string& id, const std::string& hostname = "octopi")
{
	return DeviceInfo(id, hostname, "linux", "armv7l", "Raspberry Pi 3 Model B Rev 1.2", "0.18.0", "_default");
}

inline DeviceMessage makeMessage(const std::string& id, const std::string& type, int x)
{
	return DeviceMessage(id, type, nlohmann::json { { "x", x } });
}

}	// namespace Test
}	// namespace LinkHelper

#endif	 // LH_TEST_TESTUTIL_HPP
