#include "RelayCommand.hpp"

#include "../osdep/OSUtils.hpp"
#include "../relay/DeviceInfo.hpp"
#include "../relay/DeviceMessage.hpp"
#include "../relay/Mailbox.hpp"
#include "../relay/PresenceRegistry.hpp"
#include "../relay/RelayErrors.hpp"
#include "../relay/RelayUtil.hpp"

#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

namespace LinkHelper {

namespace {

const char* const PROGRAM_NAME = "lhrelay";

nlohmann::json parseArgJson(const char* what, const std::string& arg)
{
	try {
		return nlohmann::json::parse(arg);
	}
	catch (const nlohmann::json::parse_error& e) {
		throw ValidationError(what, std::string("not valid JSON: ") + e.what());
	}
}

}	// anonymous namespace

void printRelayHelp(const char* pn, FILE* out)
{
	fprintf(out, "Usage: %s [-c <config.json>] <command> [<args>]\n\n", pn);
	fprintf(out, "Commands:\n");
	fprintf(out, "  presence <client_address> <device_info_json>   - Record a device heartbeat\n");
	fprintf(out, "  devices <client_address>                       - List active devices\n");
	fprintf(out, "  push <client_address> <device_message_json>    - Queue a message for a device\n");
	fprintf(out, "  pull <client_address> <device_id> [<count>]    - Drain pending messages\n");
	fprintf(out, "\nEnvironment: LH_REDIS_HOST LH_REDIS_PORT LH_REDIS_PASSWORD LH_REDIS_CLUSTER LH_STORE_MODE\n");
}

int runRelayCommand(
	const std::vector<std::string>& args,
	const RelayConfig& rc,
	const std::shared_ptr<RelayStore>& store,
	FILE* out,
	FILE* err)
{
	if (args.empty()) {
		printRelayHelp(PROGRAM_NAME, err);
		return LH_EXIT_BAD_INPUT;
	}

	const std::string& command = args[0];
	try {
		PresenceRegistry registry(store, rc);
		Mailbox mailbox(store, rc);

		if ((command == "presence") && (args.size() == 3)) {
			DeviceInfo info = DeviceInfo::fromJson(parseArgJson("device_info", args[2]));
			registry.updatePresence(args[1], info.deviceId(), info);
			fprintf(out, "OK\n");
		}
		else if ((command == "devices") && (args.size() == 2)) {
			nlohmann::json devices = nlohmann::json::array();
			for (const auto& d : registry.listActiveDevices(args[1])) {
				devices.push_back(d.toJson());
			}
			fprintf(out, "%s\n", OSUtils::jsonDump(devices).c_str());
		}
		else if ((command == "push") && (args.size() == 3)) {
			DeviceMessage msg = DeviceMessage::fromJson(parseArgJson("device_message", args[2]));
			mailbox.pushMessage(args[1], msg.deviceId(), msg);
			fprintf(out, "OK\n");
		}
		else if ((command == "pull") && ((args.size() == 3) || (args.size() == 4))) {
			validateDeviceId(args[2]);
			long long count = mailbox.defaultPullBatchSize();
			if (args.size() == 4) {
				count = (long long)OSUtils::jsonInt(nlohmann::json(args[3]), -1);
				if (count <= 0) {
					throw ValidationError("count", "must be a positive integer");
				}
			}
			nlohmann::json messages = nlohmann::json::array();
			for (const auto& m : mailbox.pullMessages(args[1], args[2], count)) {
				messages.push_back(m.toJson());
			}
			fprintf(out, "%s\n", OSUtils::jsonDump(messages).c_str());
		}
		else {
			printRelayHelp(PROGRAM_NAME, err);
			return LH_EXIT_BAD_INPUT;
		}
	}
	catch (const ValidationError& e) {
		fprintf(err, "%s: invalid input: %s\n", PROGRAM_NAME, e.what());
		return LH_EXIT_BAD_INPUT;
	}
	catch (const sw::redis::Error& e) {
		fprintf(err, "%s: %s: store error: %s\n", _timestr(), PROGRAM_NAME, e.what());
		return LH_EXIT_STORE_ERROR;
	}
	catch (const StoreError& e) {
		fprintf(err, "%s: %s: store error: %s\n", _timestr(), PROGRAM_NAME, e.what());
		return LH_EXIT_STORE_ERROR;
	}

	return LH_EXIT_OK;
}

int runRelayCommand(const std::vector<std::string>& args, const RelayConfig& rc, FILE* out, FILE* err)
{
	std::shared_ptr<RelayStore> store;
	try {
		store = makeRelayStore(rc);
	}
	catch (const sw::redis::Error& e) {
		fprintf(err, "%s: %s: store error: %s\n", _timestr(), PROGRAM_NAME, e.what());
		return LH_EXIT_STORE_ERROR;
	}
	return runRelayCommand(args, rc, store, out, err);
}

}	// namespace LinkHelper
