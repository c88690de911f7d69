#ifndef PRODUCER_PERF_DISPATCH_PLAN_H_
#define PRODUCER_PERF_DISPATCH_PLAN_H_

#include <cstdint>
#include <vector>

namespace ProducerPerf {

/**
 * Splits message_load across workers. Every worker gets
 * message_load / workers messages and the last one also takes the
 * remainder, so the chunks always sum to message_load.
 * @throws ConfigurationError if workers is not in [1, message_load]
 */
std::vector<int64_t> PlanChunks(int64_t message_load, int workers);

} // namespace ProducerPerf

#endif // PRODUCER_PERF_DISPATCH_PLAN_H_
