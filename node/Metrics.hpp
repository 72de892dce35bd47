#ifndef LH_METRICS_HPP
#define LH_METRICS_HPP

#include <prometheus/simpleapi.h>
#include <string>

namespace LinkHelper {
namespace Metrics {

// Presence registry
extern prometheus::simpleapi::counter_metric_t presence_update;
extern prometheus::simpleapi::counter_metric_t presence_list;
extern prometheus::simpleapi::counter_metric_t presence_info_skipped;

// Mailbox queue
extern prometheus::simpleapi::counter_metric_t message_push;
extern prometheus::simpleapi::counter_metric_t message_pull;
extern prometheus::simpleapi::counter_metric_t message_delivered;
extern prometheus::simpleapi::counter_metric_t message_malformed;

// Store
extern prometheus::simpleapi::counter_metric_t store_transactions;
extern prometheus::simpleapi::counter_metric_t store_errors;

/**
 * Start periodically writing all metrics to a file in the Prometheus text format
 *
 * @param path Output file
 * @return False if the file could not be opened for writing
 */
bool saveToFile(const std::string& path);

}	// namespace Metrics
}	// namespace LinkHelper

#endif	 // LH_METRICS_HPP
