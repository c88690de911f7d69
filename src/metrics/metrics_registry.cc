#include "metrics_registry.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace ProducerPerf {

//----------------------------------------------------------------------------
// Meter
//----------------------------------------------------------------------------

Meter::Meter() : start_(std::chrono::steady_clock::now()) {}

void Meter::Mark(int64_t n) {
    absl::MutexLock lock(&mu_);
    count_ += n;
}

Meter::Snapshot Meter::GetSnapshot() const {
    Snapshot s;
    {
        absl::MutexLock lock(&mu_);
        s.count = count_;
    }
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    if (elapsed.count() > 0) {
        s.rate_mean = static_cast<double>(s.count) / elapsed.count();
    }
    return s;
}

//----------------------------------------------------------------------------
// Histogram
//----------------------------------------------------------------------------

Histogram::Histogram(size_t reservoir_size)
    : reservoir_size_(std::max<size_t>(reservoir_size, 1)),
      rng_(std::random_device{}()) {
    reservoir_.reserve(reservoir_size_);
}

void Histogram::Update(int64_t value) {
    absl::MutexLock lock(&mu_);
    count_++;
    if (reservoir_.size() < reservoir_size_) {
        reservoir_.push_back(value);
        return;
    }
    // Algorithm R: keep each of the count_ values with equal probability.
    std::uniform_int_distribution<int64_t> dist(0, count_ - 1);
    int64_t r = dist(rng_);
    if (r < static_cast<int64_t>(reservoir_size_)) {
        reservoir_[static_cast<size_t>(r)] = value;
    }
}

Histogram::Snapshot Histogram::GetSnapshot() const {
    Snapshot s;
    {
        absl::MutexLock lock(&mu_);
        s.count = count_;
        s.values = reservoir_;
    }
    std::sort(s.values.begin(), s.values.end());
    return s;
}

double Histogram::Snapshot::Mean() const {
    if (values.empty()) return 0.0;
    long double sum = std::accumulate(values.begin(), values.end(), static_cast<long double>(0.0L));
    return static_cast<double>(sum / static_cast<long double>(values.size()));
}

double Histogram::Snapshot::StdDev() const {
    if (values.empty()) return 0.0;
    double mean = Mean();
    double sum = 0.0;
    for (int64_t v : values) {
        double d = static_cast<double>(v) - mean;
        sum += d * d;
    }
    return std::sqrt(sum / static_cast<double>(values.size()));
}

std::vector<double> Histogram::Snapshot::Percentiles(const std::vector<double>& ps) const {
    std::vector<double> scores(ps.size(), 0.0);
    const size_t n = values.size();
    if (n == 0) return scores;

    for (size_t i = 0; i < ps.size(); i++) {
        double pos = ps[i] * static_cast<double>(n + 1);
        if (pos < 1.0) {
            scores[i] = static_cast<double>(values[0]);
        } else if (pos >= static_cast<double>(n)) {
            scores[i] = static_cast<double>(values[n - 1]);
        } else {
            size_t idx = static_cast<size_t>(pos);
            double lower = static_cast<double>(values[idx - 1]);
            double upper = static_cast<double>(values[idx]);
            scores[i] = lower + (pos - std::floor(pos)) * (upper - lower);
        }
    }
    return scores;
}

//----------------------------------------------------------------------------
// Counter
//----------------------------------------------------------------------------

void Counter::Inc(int64_t n) {
    absl::MutexLock lock(&mu_);
    count_ += n;
}

void Counter::Dec(int64_t n) {
    absl::MutexLock lock(&mu_);
    count_ -= n;
}

int64_t Counter::Count() const {
    absl::MutexLock lock(&mu_);
    return count_;
}

//----------------------------------------------------------------------------
// MetricsRegistry
//----------------------------------------------------------------------------

std::shared_ptr<Metric> MetricsRegistry::Get(const std::string& name) const {
    absl::MutexLock lock(&mu_);
    auto it = metrics_.find(name);
    if (it == metrics_.end()) {
        return nullptr;
    }
    return it->second;
}

size_t MetricsRegistry::size() const {
    absl::MutexLock lock(&mu_);
    return metrics_.size();
}

} // namespace ProducerPerf
