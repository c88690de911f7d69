#include "metrics_reporter.h"

#include <ostream>

#include <glog/logging.h>
#include "absl/strings/str_format.h"
#include "absl/time/time.h"

namespace ProducerPerf {

namespace {
constexpr double kMiB = 1024.0 * 1024.0;
}

std::optional<std::string> FormatMetrics(const MetricsRegistry& registry, size_t message_size) {
	auto record_send_rate = registry.GetAs<Meter>(kRecordSendRate);
	auto request_latency = registry.GetAs<Histogram>(kRequestLatencyInMs);
	auto outgoing_byte_rate = registry.GetAs<Meter>(kOutgoingByteRate);
	auto requests_in_flight = registry.GetAs<Counter>(kRequestsInFlight);

	if (!record_send_rate || !request_latency || !outgoing_byte_rate || !requests_in_flight) {
		return std::nullopt;
	}

	Meter::Snapshot send_rate = record_send_rate->GetSnapshot();
	Histogram::Snapshot latency = request_latency->GetSnapshot();
	std::vector<double> percentiles = latency.Percentiles({0.5, 0.75, 0.95, 0.99, 0.999});
	Meter::Snapshot byte_rate = outgoing_byte_rate->GetSnapshot();
	int64_t in_flight = requests_in_flight->Count();

	return absl::StrFormat(
		"%d records sent, %.1f records/sec (%.2f MiB/sec ingress, %.2f MiB/sec egress), "
		"%.1f ms avg latency, %.1f ms stddev, %.1f ms 50th, %.1f ms 75th, "
		"%.1f ms 95th, %.1f ms 99th, %.1f ms 99.9th, %d total req. in flight",
		send_rate.count,
		send_rate.rate_mean,
		send_rate.rate_mean * static_cast<double>(message_size) / kMiB,
		byte_rate.rate_mean / kMiB,
		latency.Mean(),
		latency.StdDev(),
		percentiles[0],
		percentiles[1],
		percentiles[2],
		percentiles[3],
		percentiles[4],
		in_flight);
}

bool PrintMetrics(std::ostream& out, const MetricsRegistry& registry, size_t message_size) {
	auto line = FormatMetrics(registry, message_size);
	if (!line.has_value()) {
		return false;
	}
	out << *line << std::endl;
	return true;
}

MetricsReporter::MetricsReporter(const MetricsRegistry& registry, std::ostream& out,
		size_t message_size, std::chrono::milliseconds interval)
	: registry_(registry), out_(out), message_size_(message_size), interval_(interval) {}

MetricsReporter::~MetricsReporter() {
	Stop();
}

void MetricsReporter::Start() {
	if (thread_.joinable()) {
		LOG(WARNING) << "MetricsReporter already started";
		return;
	}
	thread_ = std::thread(&MetricsReporter::ReportLoop, this);
}

void MetricsReporter::Stop() {
	{
		absl::MutexLock lock(&mu_);
		cancelled_ = true;
	}
	if (thread_.joinable()) {
		thread_.join();
		VLOG(1) << "MetricsReporter stopped";
	}
}

void MetricsReporter::ReportLoop() {
	absl::Duration interval = absl::FromChrono(interval_);
	absl::Time next = absl::Now() + interval;
	while (true) {
		{
			absl::MutexLock lock(&mu_);
			if (mu_.AwaitWithDeadline(absl::Condition(&cancelled_), next)) {
				return;
			}
		}
		next += interval;

		// Printed outside the lock so Stop() never waits on a slow stream.
		bool printed = PrintMetrics(out_, registry_, message_size_);

		absl::MutexLock lock(&mu_);
		if (printed) {
			lines_printed_++;
		} else {
			ticks_skipped_++;
		}
	}
}

uint64_t MetricsReporter::lines_printed() const {
	absl::MutexLock lock(&mu_);
	return lines_printed_;
}

uint64_t MetricsReporter::ticks_skipped() const {
	absl::MutexLock lock(&mu_);
	return ticks_skipped_;
}

} // namespace ProducerPerf
