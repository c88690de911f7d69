#ifndef PRODUCER_PERF_METRICS_REPORTER_H_
#define PRODUCER_PERF_METRICS_REPORTER_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <thread>

#include "absl/synchronization/mutex.h"

#include "metrics_registry.h"

namespace ProducerPerf {

/**
 * Renders one human readable line from the producer client's metrics.
 * Ingress MiB/sec is the record send rate times message_size.
 * @return std::nullopt if any of the four metrics is not registered yet
 */
std::optional<std::string> FormatMetrics(const MetricsRegistry& registry, size_t message_size);

/**
 * Writes FormatMetrics() plus a newline to out.
 * @return false if the line was skipped because a metric is missing
 */
bool PrintMetrics(std::ostream& out, const MetricsRegistry& registry, size_t message_size);

/**
 * Prints the metrics line at a fixed cadence on a background thread until
 * stopped. The final snapshot is the caller's job.
 */
class MetricsReporter {
public:
	MetricsReporter(const MetricsRegistry& registry, std::ostream& out, size_t message_size,
			std::chrono::milliseconds interval = std::chrono::seconds(5));
	~MetricsReporter();

	MetricsReporter(const MetricsReporter&) = delete;
	MetricsReporter& operator=(const MetricsReporter&) = delete;

	void Start();

	// Cancels the ticking loop and waits for the thread to exit.
	void Stop();

	uint64_t lines_printed() const;
	uint64_t ticks_skipped() const;

private:
	void ReportLoop();

	const MetricsRegistry& registry_;
	std::ostream& out_;
	const size_t message_size_;
	const std::chrono::milliseconds interval_;

	mutable absl::Mutex mu_;
	bool cancelled_ ABSL_GUARDED_BY(mu_) = false;
	uint64_t lines_printed_ ABSL_GUARDED_BY(mu_) = 0;
	uint64_t ticks_skipped_ ABSL_GUARDED_BY(mu_) = 0;
	std::thread thread_;
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_METRICS_REPORTER_H_
