#include "RelayUtil.hpp"

#include "../osdep/OSUtils.hpp"

#include <ctime>

namespace LinkHelper {

const char* _timestr()
{
	time_t t = time(0);
	char* ts = ctime(&t);
	char* p = ts;
	if (! p)
		return "";
	while (*p) {
		if (*p == '\n') {
			*p = (char)0;
			break;
		}
		++p;
	}
	return ts;
}

double wallClockSeconds()
{
	return (double)OSUtils::now() / 1000.0;
}

std::size_t utf8Length(const std::string& s)
{
	std::size_t n = 0;
	for (std::string::const_iterator i = s.begin(); i != s.end(); ++i) {
		if ((((unsigned char)*i) & 0xc0) != 0x80) {
			++n;
		}
	}
	return n;
}

std::string trim(const std::string& s)
{
	static const char* ws = " \t\r\n\f\v";
	const std::size_t start = s.find_first_not_of(ws);
	if (start == std::string::npos) {
		return std::string();
	}
	const std::size_t end = s.find_last_not_of(ws);
	return s.substr(start, end - start + 1);
}

}	// namespace LinkHelper
