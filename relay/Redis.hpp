#ifndef LH_REDIS_HPP
#define LH_REDIS_HPP

#include <string>

namespace LinkHelper {

struct RedisConfig {
	std::string hostname;
	int port;
	std::string password;
	bool clusterMode;

	RedisConfig() : hostname("127.0.0.1"), port(6379), password(""), clusterMode(false)
	{
	}
};

}	// namespace LinkHelper

#endif	 // LH_REDIS_HPP
