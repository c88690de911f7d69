#ifndef PRODUCER_PERF_ERRORS_H_
#define PRODUCER_PERF_ERRORS_H_

#include <stdexcept>
#include <string>

namespace ProducerPerf {

// Process exit statuses
constexpr int kExitOk = 0;
constexpr int kExitUsage = 64;      // invalid input before any work started
constexpr int kExitFailure = 69;    // failure during work

/**
 * Base class for every error that ends a benchmark run.
 * exit_code() is the status RunBenchmark returns for it.
 */
class ProducerPerfError : public std::runtime_error {
public:
    ProducerPerfError(const std::string& what, int exit_code)
        : std::runtime_error(what), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

/**
 * Bad or missing parameters, unknown scheme names, unreadable or empty
 * message files. Always raised before dispatch begins.
 */
class ConfigurationError : public ProducerPerfError {
public:
    explicit ConfigurationError(const std::string& what)
        : ProducerPerfError(what, kExitUsage) {}
};

/**
 * Test data could not be produced (random source failure, undecodable line).
 */
class GenerationError : public ProducerPerfError {
public:
    explicit GenerationError(const std::string& what)
        : ProducerPerfError(what, kExitFailure) {}
};

class DecodeError : public GenerationError {
public:
    explicit DecodeError(const std::string& what) : GenerationError(what) {}
};

/**
 * The producer client failed to deliver a message, or could not be
 * created or closed. The run is void once this is raised.
 */
class DeliveryError : public ProducerPerfError {
public:
    explicit DeliveryError(const std::string& what)
        : ProducerPerfError(what, kExitFailure) {}
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_ERRORS_H_
