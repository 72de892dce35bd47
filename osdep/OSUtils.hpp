#ifndef LH_OSUTILS_HPP
#define LH_OSUTILS_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace LinkHelper {

/**
 * Miscellaneous OS and JSON helpers
 */
class OSUtils {
  public:
	/**
	 * @return Current wall clock time in milliseconds since epoch
	 */
	static int64_t now();

	/**
	 * Read the full contents of a file into a string
	 *
	 * @param path Path to file
	 * @param buf Buffer to fill (replaced on success)
	 * @return True if the file could be opened and read
	 */
	static bool readFile(const char* path, std::string& buf);

	/**
	 * @return Value of environment variable or empty string if unset
	 */
	static std::string getEnv(const char* name);

	static std::string jsonString(const nlohmann::json& jv, const char* dfl);
	static int64_t jsonInt(const nlohmann::json& jv, int64_t dfl);
	static bool jsonBool(const nlohmann::json& jv, bool dfl);
	static std::string jsonDump(const nlohmann::json& j, int indentation = 1);
};

}	// namespace LinkHelper

#endif	 // LH_OSUTILS_HPP
