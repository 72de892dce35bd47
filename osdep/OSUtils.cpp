#include "OSUtils.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace LinkHelper {

int64_t OSUtils::now()
{
	return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
			   std::chrono::system_clock::now().time_since_epoch())
		.count();
}

bool OSUtils::readFile(const char* path, std::string& buf)
{
	std::ifstream in(path, std::ios::in | std::ios::binary);
	if (! in) {
		return false;
	}
	std::ostringstream tmp;
	tmp << in.rdbuf();
	if (in.bad()) {
		return false;
	}
	buf = tmp.str();
	return true;
}

std::string OSUtils::getEnv(const char* name)
{
	const char* v = std::getenv(name);
	return (v) ? std::string(v) : std::string();
}

std::string OSUtils::jsonString(const nlohmann::json& jv, const char* dfl)
{
	if (jv.is_string()) {
		return jv.get<std::string>();
	}
	else if (jv.is_number_integer()) {
		return std::to_string(jv.get<int64_t>());
	}
	else if (jv.is_number_float()) {
		return std::to_string(jv.get<double>());
	}
	else if (jv.is_boolean()) {
		return (jv.get<bool>() ? std::string("1") : std::string("0"));
	}
	return std::string((dfl) ? dfl : "");
}

int64_t OSUtils::jsonInt(const nlohmann::json& jv, int64_t dfl)
{
	if (jv.is_number_unsigned()) {
		const uint64_t v = jv.get<uint64_t>();
		return (v > (uint64_t)std::numeric_limits<int64_t>::max()) ? dfl : (int64_t)v;
	}
	else if (jv.is_number_integer()) {
		return jv.get<int64_t>();
	}
	else if (jv.is_number_float()) {
		// only whole values that fit, the conversion is undefined otherwise
		const double v = jv.get<double>();
		if ((std::isfinite(v)) && (v == std::trunc(v)) && (v >= -9223372036854775808.0) && (v < 9223372036854775808.0)) {
			return (int64_t)v;
		}
	}
	else if (jv.is_string()) {
		const std::string s = jv.get<std::string>();
		char* end = nullptr;
		long long v = std::strtoll(s.c_str(), &end, 10);
		if ((! s.empty()) && (end) && (*end == (char)0)) {
			return (int64_t)v;
		}
	}
	else if (jv.is_boolean()) {
		return (jv.get<bool>() ? 1 : 0);
	}
	return dfl;
}

bool OSUtils::jsonBool(const nlohmann::json& jv, bool dfl)
{
	if (jv.is_boolean()) {
		return jv.get<bool>();
	}
	else if (jv.is_number_integer()) {
		return (jv.get<int64_t>() > 0);
	}
	else if (jv.is_string()) {
		const std::string s = jv.get<std::string>();
		if (s.empty()) {
			return dfl;
		}
		return ((s[0] == '1') || (s[0] == 't') || (s[0] == 'T') || (s[0] == 'y') || (s[0] == 'Y'));
	}
	return dfl;
}

std::string OSUtils::jsonDump(const nlohmann::json& j, int indentation)
{
	return j.dump(indentation, ' ', false, nlohmann::json::error_handler_t::replace);
}

}	// namespace LinkHelper
