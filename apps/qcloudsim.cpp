#include <qcloudsim/core/device_profile.hpp>
#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/error.hpp>
#include <qcloudsim/core/types.hpp>

#include <qcloudsim/algo/error.hpp>
#include <qcloudsim/algo/hybrid_cloud.hpp>
#include <qcloudsim/algo/job_feed.hpp>

#include <qcloudsim/io/error.hpp>
#include <qcloudsim/io/job_loader.hpp>
#include <qcloudsim/io/ledger_writer.hpp>
#include <qcloudsim/io/metrics.hpp>
#include <qcloudsim/io/platform_loader.hpp>
#include <qcloudsim/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace core = qcloudsim::core;
namespace algo = qcloudsim::algo;
namespace io = qcloudsim::io;

struct Config {
    std::string platform_file;
    std::string jobs_file;
    std::optional<std::size_t> generate;
    double arrival_rate{3.0};
    std::string scheduler{"capacity"};
    std::string bulk{"none"};
    uint32_t seed{0};
    double until{0.0};  // 0 = run until every job is done
    bool maintenance{true};
    std::string trace_file;
    std::string trace_format{"json"};
    std::string ledger_file;
    bool metrics{false};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("qcloudsim", "Hybrid quantum/classical cloud simulator");

    options.add_options()
        ("p,platform", "Platform configuration (JSON)", cxxopts::value<std::string>())
        ("j,jobs", "Job list to dispatch (.csv or .json)", cxxopts::value<std::string>())
        ("g,generate", "Generate N random jobs instead of reading a job list", cxxopts::value<std::size_t>())
        ("arrival-rate", "Arrival rate of generated jobs (default: 3)", cxxopts::value<double>()->default_value("3"))
        ("s,scheduler", "Scheduler: serial|capacity (default: capacity)", cxxopts::value<std::string>()->default_value("capacity"))
        ("bulk", "Bulk allocation: none|fast|smart (default: none)", cxxopts::value<std::string>()->default_value("none"))
        ("seed", "Random seed (default: 0)", cxxopts::value<uint32_t>()->default_value("0"))
        ("u,until", "Simulation horizon in time units (default: until all jobs finish)", cxxopts::value<double>()->default_value("0"))
        ("maintenance", "Run device maintenance windows (default)")
        ("no-maintenance", "Disable device maintenance windows")
        ("t,trace", "Trace output file ('-' for stdout)", cxxopts::value<std::string>())
        ("trace-format", "Trace format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("l,ledger", "Write the job ledger as JSON ('-' for stdout)", cxxopts::value<std::string>())
        ("metrics", "Print metrics to stderr")
        ("list-presets", "List device presets and exit")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("list-presets") != 0U) {
        for (auto name : core::preset_names()) {
            const auto& preset = core::device_preset(name);
            std::cout << name;
            if (preset.clops && preset.quantum_volume) {
                std::cout << "  clops=" << *preset.clops << " qv=" << *preset.quantum_volume;
            }
            std::cout << "  maintenance=" << preset.maintenance.interval << "/"
                      << preset.maintenance.duration << std::endl;
        }
        std::exit(0);
    }

    if (result.count("platform") == 0U) {
        std::cerr << "Error: --platform is required" << std::endl;
        std::exit(64);
    }

    if ((result.count("jobs") == 0U) == (result.count("generate") == 0U)) {
        std::cerr << "Error: exactly one of --jobs or --generate is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.platform_file = result["platform"].as<std::string>();
    if (result.count("jobs") != 0U) {
        config.jobs_file = result["jobs"].as<std::string>();
    }
    if (result.count("generate") != 0U) {
        config.generate = result["generate"].as<std::size_t>();
    }
    config.arrival_rate = result["arrival-rate"].as<double>();
    config.scheduler = result["scheduler"].as<std::string>();
    config.bulk = result["bulk"].as<std::string>();
    config.seed = result["seed"].as<uint32_t>();
    config.until = result["until"].as<double>();
    config.maintenance = result.count("no-maintenance") == 0U;
    if (result.count("trace") != 0U) {
        config.trace_file = result["trace"].as<std::string>();
    }
    config.trace_format = result["trace-format"].as<std::string>();
    if (result.count("ledger") != 0U) {
        config.ledger_file = result["ledger"].as<std::string>();
    }
    config.metrics = result.count("metrics") != 0U;
    config.verbose = result.count("verbose") != 0U;

    return config;
}

std::unique_ptr<core::TraceWriter> make_trace_writer(const Config& config, std::ostream& out) {
    if (config.trace_format == "json") {
        return std::make_unique<io::JsonTraceWriter>(out);
    }
    if (config.trace_format == "text") {
        return std::make_unique<io::TextualTraceWriter>(out);
    }
    if (config.trace_format == "null") {
        return std::make_unique<io::NullTraceWriter>();
    }
    throw algo::ConfigurationError("Unknown trace format: " + config.trace_format);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        // 1. Create engine and cloud
        core::Engine engine;
        algo::CloudConfig cloud_config;
        cloud_config.scheduler = algo::parse_scheduler_policy(config.scheduler);
        if (config.bulk != "none") {
            cloud_config.bulk = algo::parse_bulk_policy(config.bulk);
        }
        cloud_config.seed = config.seed;
        cloud_config.maintenance = config.maintenance;
        algo::HybridCloud cloud(engine, cloud_config);

        // 2. Load platform
        if (config.verbose) {
            std::cerr << "Loading platform from: " << config.platform_file << std::endl;
        }
        io::build_platform(cloud, io::load_platform(config.platform_file));

        // 3. Build the job feed
        std::unique_ptr<algo::JobFeed> feed;
        if (config.generate) {
            algo::GeneratorParams params;
            params.arrival_rate = config.arrival_rate;
            params.max_jobs = *config.generate;
            feed = std::make_unique<algo::GeneratorFeed>(params);
        } else {
            if (config.verbose) {
                std::cerr << "Loading jobs from: " << config.jobs_file << std::endl;
            }
            feed = std::make_unique<algo::DispatcherFeed>(io::load_jobs(config.jobs_file));
        }

        // 4. Setup trace writer
        std::unique_ptr<core::TraceWriter> writer;
        std::ofstream trace_out;
        if (!config.trace_file.empty()) {
            if (config.trace_file == "-") {
                writer = make_trace_writer(config, std::cout);
            } else {
                trace_out.open(config.trace_file);
                if (!trace_out) {
                    std::cerr << "Error: cannot open trace file: " << config.trace_file << std::endl;
                    return 1;
                }
                writer = make_trace_writer(config, trace_out);
            }
            engine.set_trace_writer(writer.get());
        }

        if (config.verbose) {
            std::cerr << "Starting simulation..." << std::endl;
        }

        // 5. Run simulation
        std::optional<core::TimePoint> until;
        if (config.until > 0) {
            until = core::time_from_units(config.until);
        }
        algo::run_simulation(cloud, *feed, until);

        // 6. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }
        engine.set_trace_writer(nullptr);

        if (!config.ledger_file.empty()) {
            if (config.ledger_file == "-") {
                io::write_ledger_to_stream(cloud.ledger(), std::cout);
            } else {
                io::write_ledger(cloud.ledger(), config.ledger_file);
            }
        }

        if (config.metrics) {
            io::print_metrics(io::compute_metrics(cloud.ledger()), std::cerr);
        }

        if (config.verbose) {
            std::cerr << "Simulation complete at time: " << core::time_to_units(engine.time())
                      << " (" << cloud.completed() << " completed, " << cloud.rejected()
                      << " rejected)" << std::endl;
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const algo::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::SimulationError& e) {
        std::cerr << "Simulation error: " << e.what() << std::endl;
        return 2;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
