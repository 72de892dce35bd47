#ifndef LH_RELAYERRORS_HPP
#define LH_RELAYERRORS_HPP

#include <stdexcept>
#include <string>

namespace LinkHelper {

/**
 * Thrown when an entity is constructed from values violating its field constraints
 *
 * Only the first violated constraint is reported.
 */
class ValidationError : public std::runtime_error {
  public:
	ValidationError(const std::string& field, const std::string& problem)
		: std::runtime_error(field + ": " + problem)
		, _field(field)
	{
	}

	const std::string& field() const
	{
		return _field;
	}

  private:
	std::string _field;
};

/**
 * Thrown by the in-process store on misuse (e.g. wrong value type for a key)
 */
class StoreError : public std::runtime_error {
  public:
	explicit StoreError(const std::string& what) : std::runtime_error(what)
	{
	}
};

}	// namespace LinkHelper

#endif	 // LH_RELAYERRORS_HPP
