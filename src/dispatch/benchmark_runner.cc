#include "benchmark_runner.h"

#include <exception>
#include <ostream>
#include <string>

#include <glog/logging.h>

#include "../common/errors.h"
#include "../generator/message_generator.h"
#include "../metrics/metrics_reporter.h"
#include "async_dispatcher.h"
#include "sync_dispatcher.h"

namespace ProducerPerf {

std::unique_ptr<Dispatcher> MakeDispatcher(const BenchmarkConfig& config, ProducerClient& client,
		MessageGenerator& generator, std::chrono::milliseconds window) {
	if (config.mode == RunMode::kSync) {
		return std::make_unique<SyncDispatcher>(config, client, generator, window);
	}
	return std::make_unique<AsyncDispatcher>(config, client, generator, window);
}

namespace {

void Execute(const BenchmarkConfig& config, const ProducerClientFactory& factory, std::ostream& out) {
	std::unique_ptr<ProducerClient> client = factory(config.producer);
	if (!client) {
		throw DeliveryError("Failed to create producer: no client");
	}

	MetricsReporter reporter(client->Metrics(), out, config.message_size, config.report_interval);
	reporter.Start();

	std::unique_ptr<MessageGenerator> generator = MakeMessageGenerator(config);
	LOG(INFO) << "Producing " << config.message_load << " messages to " << config.topic
		<< (config.mode == RunMode::kSync ? " synchronously with " : " asynchronously with ")
		<< (config.mode == RunMode::kSync ? config.routines : 1) << " routine(s)";

	DispatchResult result = MakeDispatcher(config, *client, *generator)->Run();

	reporter.Stop();
	// Final snapshot, printed no matter where the reporting cadence stopped.
	if (!PrintMetrics(out, client->Metrics(), config.message_size)) {
		LOG(WARNING) << "No delivery metrics recorded";
	}
	LOG(INFO) << "Benchmark done: " << result.sent << " sent, " << result.acknowledged << " acknowledged";

	std::string errstr;
	if (!client->Close(errstr)) {
		throw DeliveryError("Failed to close producer: " + errstr);
	}
}

} // namespace

int RunBenchmark(const BenchmarkConfig& config, const ProducerClientFactory& factory,
		std::ostream& out, std::ostream& err) {
	try {
		Execute(config, factory, out);
	} catch (const ProducerPerfError& e) {
		LOG(ERROR) << "Benchmark failed: " << e.what();
		err << "ERROR: " << e.what() << std::endl;
		return e.exit_code();
	} catch (const std::exception& e) {
		// Thread creation, allocation and other runtime failures during work
		LOG(ERROR) << "Benchmark failed: " << e.what();
		err << "ERROR: " << e.what() << std::endl;
		return kExitFailure;
	}
	return kExitOk;
}

} // namespace ProducerPerf
