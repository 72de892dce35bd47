#ifndef LH_RELAYCOMMAND_HPP
#define LH_RELAYCOMMAND_HPP

#include "../relay/RelayConfig.hpp"
#include "../relay/RelayStore.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#define LH_EXIT_OK 0
#define LH_EXIT_STORE_ERROR 1
#define LH_EXIT_BAD_INPUT 2

namespace LinkHelper {

void printRelayHelp(const char* pn, FILE* out);

/**
 * Run one lhrelay command against a store
 *
 * args[0] is the command name. Results are written to out as JSON (or OK),
 * diagnostics to err.
 *
 * @return LH_EXIT_OK, LH_EXIT_STORE_ERROR or LH_EXIT_BAD_INPUT
 */
int runRelayCommand(
	const std::vector<std::string>& args,
	const RelayConfig& rc,
	const std::shared_ptr<RelayStore>& store,
	FILE* out,
	FILE* err);

/**
 * Run one lhrelay command against the store rc selects
 */
int runRelayCommand(const std::vector<std::string>& args, const RelayConfig& rc, FILE* out, FILE* err);

}	// namespace LinkHelper

#endif	 // LH_RELAYCOMMAND_HPP
