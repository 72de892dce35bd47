#include "Metrics.hpp"

#include <chrono>

namespace prometheus {
namespace simpleapi {
std::shared_ptr<Registry> registry_ptr = std::make_shared<Registry>();
Registry& registry = *registry_ptr;
SaveToFile saver;
}	// namespace simpleapi
}	// namespace prometheus

namespace LinkHelper {
namespace Metrics {

prometheus::simpleapi::counter_metric_t presence_update { "lh_presence_update", "number of presence heartbeats recorded" };
prometheus::simpleapi::counter_metric_t presence_list { "lh_presence_list", "number of active device listings" };
prometheus::simpleapi::counter_metric_t presence_info_skipped {
	"lh_presence_info_skipped", "active devices skipped because their snapshot expired or failed to parse"
};

prometheus::simpleapi::counter_metric_t message_push { "lh_message_push", "number of messages enqueued" };
prometheus::simpleapi::counter_metric_t message_pull { "lh_message_pull", "number of mailbox pulls" };
prometheus::simpleapi::counter_metric_t message_delivered { "lh_message_delivered", "number of popped mailbox messages returned to devices" };
prometheus::simpleapi::counter_metric_t message_malformed {
	"lh_message_malformed", "popped mailbox payloads dropped because they failed to parse"
};

prometheus::simpleapi::counter_metric_t store_transactions { "lh_store_transactions", "number of store transactions executed" };
prometheus::simpleapi::counter_metric_t store_errors { "lh_store_errors", "number of store transactions that failed" };

bool saveToFile(const std::string& path)
{
	prometheus::simpleapi::saver.set_registry(prometheus::simpleapi::registry_ptr);
	prometheus::simpleapi::saver.set_delay(std::chrono::seconds(5));
	return prometheus::simpleapi::saver.set_out_file(path);
}

}	// namespace Metrics
}	// namespace LinkHelper
