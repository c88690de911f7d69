#include "dispatch_plan.h"

#include "absl/strings/str_cat.h"

#include "../common/errors.h"

namespace ProducerPerf {

std::vector<int64_t> PlanChunks(int64_t message_load, int workers) {
	if (workers < 1 || workers > message_load) {
		throw ConfigurationError(absl::StrCat("Cannot split ", message_load, " messages across ",
					workers, " routines"));
	}
	int64_t share = message_load / workers;
	std::vector<int64_t> chunks(static_cast<size_t>(workers), share);
	chunks.back() += message_load % workers;
	return chunks;
}

} // namespace ProducerPerf
