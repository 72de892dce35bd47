#ifndef LH_RELAYUTIL_HPP
#define LH_RELAYUTIL_HPP

#include <chrono>
#include <functional>
#include <string>

namespace LinkHelper {

/**
 * Time source returning wall clock seconds since epoch
 *
 * Injected into the relay so tests can run without real time.
 */
typedef std::function<double()> Clock;

const char* _timestr();

/**
 * @return Wall clock seconds since epoch with millisecond resolution
 */
double wallClockSeconds();

/**
 * Score at or below which an entry recorded with a given window is expired
 */
inline double expiryCutoff(double now, std::chrono::seconds window)
{
	return now - (double)window.count();
}

/**
 * @return Number of UTF-8 code points in s (continuation bytes are not counted)
 */
std::size_t utf8Length(const std::string& s);

std::string trim(const std::string& s);

}	// namespace LinkHelper

#endif	 // LH_RELAYUTIL_HPP
