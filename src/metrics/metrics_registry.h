#ifndef PRODUCER_PERF_METRICS_REGISTRY_H_
#define PRODUCER_PERF_METRICS_REGISTRY_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

namespace ProducerPerf {

// Names of the metrics maintained by the producer client
constexpr char kRecordSendRate[] = "record-send-rate";
constexpr char kRequestLatencyInMs[] = "request-latency-in-ms";
constexpr char kOutgoingByteRate[] = "outgoing-byte-rate";
constexpr char kRequestsInFlight[] = "requests-in-flight";

class Metric {
public:
    virtual ~Metric() = default;
};

/**
 * Counts events and their mean rate since the meter was created.
 */
class Meter : public Metric {
public:
    struct Snapshot {
        int64_t count = 0;
        double rate_mean = 0.0;   // events per second
    };

    Meter();

    void Mark(int64_t n);
    Snapshot GetSnapshot() const;

private:
    mutable absl::Mutex mu_;
    int64_t count_ ABSL_GUARDED_BY(mu_) = 0;
    const std::chrono::steady_clock::time_point start_;
};

/**
 * Distribution of values over a uniform reservoir sample.
 */
class Histogram : public Metric {
public:
    static constexpr size_t kDefaultReservoirSize = 1028;

    struct Snapshot {
        int64_t count = 0;          // values ever recorded
        std::vector<int64_t> values; // sorted sample

        double Mean() const;
        double StdDev() const;
        // Each p is in [0, 1]; interpolates at rank p * (n + 1).
        std::vector<double> Percentiles(const std::vector<double>& ps) const;
    };

    explicit Histogram(size_t reservoir_size = kDefaultReservoirSize);

    void Update(int64_t value);
    Snapshot GetSnapshot() const;

private:
    const size_t reservoir_size_;
    mutable absl::Mutex mu_;
    int64_t count_ ABSL_GUARDED_BY(mu_) = 0;
    std::vector<int64_t> reservoir_ ABSL_GUARDED_BY(mu_);
    std::mt19937_64 rng_ ABSL_GUARDED_BY(mu_);
};

class Counter : public Metric {
public:
    void Inc(int64_t n);
    void Dec(int64_t n);
    int64_t Count() const;

private:
    mutable absl::Mutex mu_;
    int64_t count_ ABSL_GUARDED_BY(mu_) = 0;
};

/**
 * Named metrics, registered lazily by whoever updates them first.
 * Readers that find a metric missing should treat it as not yet available.
 * @threading All methods are thread-safe.
 */
class MetricsRegistry {
public:
    // Returns nullptr if nothing is registered under name.
    std::shared_ptr<Metric> Get(const std::string& name) const;

    template<typename T>
    std::shared_ptr<T> GetAs(const std::string& name) const {
        return std::dynamic_pointer_cast<T>(Get(name));
    }

    /**
     * Returns the metric registered under name, creating it if absent.
     * @return nullptr if name is already registered with another type
     */
    template<typename T>
    std::shared_ptr<T> GetOrRegister(const std::string& name) {
        absl::MutexLock lock(&mu_);
        auto it = metrics_.find(name);
        if (it != metrics_.end()) {
            return std::dynamic_pointer_cast<T>(it->second);
        }
        auto metric = std::make_shared<T>();
        metrics_.emplace(name, metric);
        return metric;
    }

    size_t size() const;

private:
    mutable absl::Mutex mu_;
    absl::flat_hash_map<std::string, std::shared_ptr<Metric>> metrics_ ABSL_GUARDED_BY(mu_);
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_METRICS_REGISTRY_H_
