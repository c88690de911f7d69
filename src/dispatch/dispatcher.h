#ifndef PRODUCER_PERF_DISPATCHER_H_
#define PRODUCER_PERF_DISPATCHER_H_

#include <cstdint>

namespace ProducerPerf {

// Totals of one dispatch run
struct DispatchResult {
	int64_t sent = 0;           // produce calls, repeats included
	int64_t acknowledged = 0;   // successful delivery reports observed
};

/**
 * Drives one benchmark run's messages through a ProducerClient.
 * Run() returns only after every delivery report it waits for has been
 * observed, or throws the first failure.
 */
class Dispatcher {
public:
	virtual ~Dispatcher() = default;

	/**
	 * @throws DeliveryError on the first failed delivery
	 * @throws GenerationError if the message stream fails
	 */
	virtual DispatchResult Run() = 0;
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_DISPATCHER_H_
