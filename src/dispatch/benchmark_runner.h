#ifndef PRODUCER_PERF_BENCHMARK_RUNNER_H_
#define PRODUCER_PERF_BENCHMARK_RUNNER_H_

#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>

#include "../client/producer_client.h"
#include "../common/config.h"
#include "../generator/message_generator.h"
#include "dispatcher.h"

namespace ProducerPerf {

// Builds the client for a run; may throw ConfigurationError or DeliveryError.
using ProducerClientFactory = std::function<std::unique_ptr<ProducerClient>(const ProducerConfig&)>;

/**
 * Sync or async dispatcher for config.mode.
 * @param window pacing window, one second outside of tests
 */
std::unique_ptr<Dispatcher> MakeDispatcher(const BenchmarkConfig& config, ProducerClient& client,
		MessageGenerator& generator, std::chrono::milliseconds window = std::chrono::seconds(1));

/**
 * Runs one benchmark end to end: creates the client, starts periodic
 * reporting to out, generates and dispatches config.message_load messages,
 * prints the final metrics line once and closes the client.
 *
 * Errors are reported as "ERROR: <message>" on err.
 * @return kExitOk, or the exit code of the error that ended the run
 */
int RunBenchmark(const BenchmarkConfig& config, const ProducerClientFactory& factory,
		std::ostream& out, std::ostream& err);

} // namespace ProducerPerf

#endif // PRODUCER_PERF_BENCHMARK_RUNNER_H_
