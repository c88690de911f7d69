#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "../client/kafka_producer_client.h"
#include "../common/configuration.h"
#include "../common/errors.h"
#include "../dispatch/benchmark_runner.h"

namespace {

int PrintUsageError(const std::string& message, const cxxopts::Options& options) {
    std::cerr << "ERROR: " << message << "\n\n"
              << "Available command line options:\n"
              << options.help() << std::endl;
    return ProducerPerf::kExitUsage;
}

// Returns std::nullopt after printing the usage error.
std::optional<cxxopts::ParseResult> ParseCommandLine(cxxopts::Options& options, int argc, char* argv[]) {
    try {
        return options.parse(argc, argv);
    } catch (const std::exception& e) {
        PrintUsageError(e.what(), options);
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    cxxopts::Options options("producer-perf", "Kafka producer performance benchmark");
    ProducerPerf::Configuration::addCommandLineOptions(options);

    std::optional<cxxopts::ParseResult> parsed = ParseCommandLine(options, argc, argv);
    if (!parsed.has_value()) {
        return ProducerPerf::kExitUsage;
    }
    const cxxopts::ParseResult& result = *parsed;

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return ProducerPerf::kExitOk;
    }
    FLAGS_v = result["log_level"].as<int>();

    ProducerPerf::Configuration configuration;
    if (result.count("config")) {
        const std::string path = result["config"].as<std::string>();
        if (!configuration.loadFromFile(path)) {
            return PrintUsageError("Failed to load configuration file " + path, options);
        }
    }
    configuration.overrideFromCommandLine(result);

    ProducerPerf::BenchmarkConfig config;
    try {
        config = configuration.build();
    } catch (const ProducerPerf::ConfigurationError& e) {
        return PrintUsageError(e.what(), options);
    }

    ProducerPerf::ProducerClientFactory factory = [](const ProducerPerf::ProducerConfig& producer_config)
            -> std::unique_ptr<ProducerPerf::ProducerClient> {
        return std::make_unique<ProducerPerf::KafkaProducerClient>(producer_config);
    };
    return ProducerPerf::RunBenchmark(config, factory, std::cout, std::cerr);
}
