#include <loopsim/core/loop.hpp>
#include <loopsim/core/tracing.hpp>
#include <loopsim/core/types.hpp>

#include <loopsim/io/error.hpp>
#include <loopsim/io/scenario_loader.hpp>
#include <loopsim/io/scenario_runner.hpp>
#include <loopsim/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

namespace core = loopsim::core;
namespace io = loopsim::io;

struct Config {
    std::string scenario_file;
    std::string output_file{"-"};
    std::string format{"json"};
    bool color{false};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("loopsim", "Deterministic thread-bound message loop simulator");

    options.add_options()
        ("i,input", "Scenario file (JSON)", cxxopts::value<std::string>())
        ("o,output", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("color", "Colour textual output")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.scenario_file = result["input"].as<std::string>();
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    config.color = result.count("color") != 0U;
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "json" && config.format != "text" && config.format != "null") {
        std::cerr << "Error: unknown format '" << config.format << "'" << std::endl;
        std::exit(64);
    }

    return config;
}

std::unique_ptr<core::TraceWriter> make_writer(const Config& config, std::ostream& out) {
    if (config.format == "null") {
        return std::make_unique<io::NullTraceWriter>();
    }
    if (config.format == "text") {
        return std::make_unique<io::TextualTraceWriter>(out, config.color);
    }
    return std::make_unique<io::JsonTraceWriter>(out);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading scenario from: " << config.scenario_file << std::endl;
        }

        // 1. Load scenario
        auto scenario = io::load_scenario(config.scenario_file);

        // 2. This thread drives every loop; bind the main loop to it
        core::Loop::prepare_main_loop();

        // 3. Setup trace writer
        std::ofstream outfile;
        std::ostream* out = &std::cout;
        if (config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            out = &outfile;
        }
        auto writer = make_writer(config, *out);

        if (config.verbose) {
            std::cerr << "Running " << scenario.steps.size() << " steps on "
                      << scenario.loops.size() << " loops..." << std::endl;
        }

        // 4. Run, with the writer installed only while the scenario runs
        io::RunSummary summary;
        {
            core::ScopedTraceWriter installed(writer.get());
            summary = io::run_scenario(scenario);
        }

        // 5. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        if (config.verbose) {
            std::cerr << "Dispatched " << summary.dispatched << " messages, rejected "
                      << summary.rejected << ", final time "
                      << core::time_to_millis(summary.final_time) << " ms" << std::endl;
            for (const auto& loop : summary.pending) {
                std::cerr << "  " << loop.name << ": " << loop.pending << " pending" << std::endl;
            }
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const io::ScenarioError& e) {
        std::cerr << "Scenario error: " << e.what() << std::endl;
        return 1;
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
