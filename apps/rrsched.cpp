#include <rrsched/core/clock.hpp>
#include <rrsched/core/engine.hpp>
#include <rrsched/core/error.hpp>
#include <rrsched/core/task.hpp>
#include <rrsched/core/types.hpp>

#include <rrsched/io/error.hpp>
#include <rrsched/io/task_json.hpp>
#include <rrsched/io/trace_writers.hpp>
#include <rrsched/io/workload_loader.hpp>

#include <cxxopts.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace core = rrsched::core;
namespace io = rrsched::io;

struct Config {
    std::string workload_file;
    double time_quantum{2.0};
    bool quantum_given{false};
    bool virtual_time{false};
    std::string output_file{"-"};
    std::string format{"null"};
    bool metrics{false};
    bool verbose{false};
    std::optional<core::TaskStatus> status_filter;
    std::optional<int> priority_filter;
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("rrsched", "Priority round-robin task scheduler");

    options.add_options()
        ("i,input", "Workload file (JSON)", cxxopts::value<std::string>())
        ("q,quantum", "Time quantum in seconds (default: 2, or the workload's)", cxxopts::value<double>()->default_value("2"))
        ("virtual-time", "Advance time instantly instead of sleeping")
        ("o,output", "Trace output (default: stderr)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Trace format: json|text|null (default: null)", cxxopts::value<std::string>()->default_value("null"))
        ("metrics", "Add the execution sequence to the report")
        ("status", "Report only tasks in this status: pending|running|completed", cxxopts::value<std::string>())
        ("priority", "Report only tasks with this priority", cxxopts::value<int>())
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
    config.workload_file = result["input"].as<std::string>();
    config.time_quantum = result["quantum"].as<double>();
    config.quantum_given = result.count("quantum") != 0U;
    config.virtual_time = result.count("virtual-time") != 0U;
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    config.metrics = result.count("metrics") != 0U;
    config.verbose = result.count("verbose") != 0U;

    if (!std::isfinite(config.time_quantum) || config.time_quantum <= 0 ||
        config.time_quantum > io::WorkloadLimits::max_time_quantum) {
        std::cerr << "Error: --quantum must be in (0, " << io::WorkloadLimits::max_time_quantum
                  << "] seconds" << std::endl;
        std::exit(64);
    }

    if (result.count("status") != 0U) {
        config.status_filter = core::task_status_from_string(result["status"].as<std::string>());
        if (!config.status_filter) {
            std::cerr << "Error: unknown status: " << result["status"].as<std::string>() << std::endl;
            std::exit(64);
        }
    }
    if (result.count("priority") != 0U) {
        config.priority_filter = result["priority"].as<int>();
    }

    if (config.format != "json" && config.format != "text" && config.format != "null") {
        std::cerr << "Error: unknown trace format: " << config.format << std::endl;
        std::exit(64);
    }

    return config;
}

// Drive the engine on the calling thread; time jumps straight to each
// submission point once the queue has drained.
void run_virtual(core::Engine& engine, core::VirtualClock& clock, const io::WorkloadData& workload,
                 bool verbose) {
    for (const auto& task : workload.tasks) {
        engine.run([&] { return engine.elapsed() >= task.submit_at; });
        if (engine.elapsed() < task.submit_at) {
            clock.advance(task.submit_at - engine.elapsed());
        }
        auto added = engine.add_task(task.spec);
        if (verbose) {
            std::cerr << "Submitted " << added.task_id << " at "
                      << core::time_to_seconds(added.arrival_time) << "s" << std::endl;
        }
    }
    engine.run();
}

// Run the background loop and submit tasks as real time passes.
bool run_realtime(core::Engine& engine, const io::WorkloadData& workload, bool verbose) {
    engine.start();
    for (const auto& task : workload.tasks) {
        core::Duration wait = task.submit_at - engine.elapsed();
        core::system_clock().sleep_for(wait);
        auto added = engine.add_task(task.spec);
        if (verbose) {
            std::cerr << "Submitted " << added.task_id << " at "
                      << core::time_to_seconds(added.arrival_time) << "s" << std::endl;
        }
    }

    while (!engine.wait_until_idle(core::duration_from_seconds(1.0))) {
        if (verbose) {
            auto current = engine.current_task();
            std::cerr << "Running " << current.value_or("-") << " at "
                      << core::duration_to_seconds(engine.elapsed()) << "s" << std::endl;
        }
    }

    if (!engine.stop()) {
        std::cerr << "Warning: execution loop did not stop within the timeout" << std::endl;
        return false;
    }
    return true;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading workload from: " << config.workload_file << std::endl;
        }

        // 1. Load and validate the workload
        auto workload = io::load_workload(config.workload_file);

        // 2. Engine configuration: the command line overrides the file
        core::EngineConfig engine_config;
        engine_config.time_quantum = core::duration_from_seconds(config.time_quantum);
        if (workload.time_quantum && !config.quantum_given) {
            engine_config.time_quantum = *workload.time_quantum;
        }

        // 3. Setup trace writer (declared first so it outlives the engine)
        std::ofstream outfile;
        std::unique_ptr<core::TraceWriter> writer;
        std::ostream* trace_out = &std::cerr;

        if (config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            trace_out = &outfile;
        }

        if (config.format == "json") {
            writer = std::make_unique<io::JsonTraceWriter>(*trace_out);
        } else if (config.format == "text") {
            writer = std::make_unique<io::TextualTraceWriter>(*trace_out, config.output_file == "-");
        } else {
            writer = std::make_unique<io::NullTraceWriter>();
        }

        // 4. Create engine on the selected clock
        core::VirtualClock virtual_clock;
        core::Clock& clock = config.virtual_time ? static_cast<core::Clock&>(virtual_clock)
                                                 : core::system_clock();
        core::Engine engine(engine_config, clock);
        engine.set_trace_writer(writer.get());

        if (config.verbose) {
            std::cerr << "Scheduling " << workload.tasks.size() << " tasks with a "
                      << core::duration_to_seconds(engine.time_quantum()) << "s quantum" << std::endl;
        }

        // 5. Run until every submitted task has completed
        bool stopped = true;
        if (config.virtual_time) {
            run_virtual(engine, virtual_clock, workload, config.verbose);
        } else {
            stopped = run_realtime(engine, workload, config.verbose);
        }

        // 6. Finalize output
        engine.set_trace_writer(nullptr);
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        std::optional<std::vector<core::ExecutionRecord>> sequence;
        if (config.metrics) {
            sequence = engine.execution_sequence();
        }
        auto tasks = io::filter_tasks(engine.list_tasks(), config.status_filter, config.priority_filter);
        io::write_report(std::cout, tasks, engine.stats(), sequence);

        if (config.verbose) {
            std::cerr << "Done at time: " << core::duration_to_seconds(engine.elapsed()) << "s"
                      << std::endl;
        }

        return stopped ? 0 : 3;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Workload error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::SchedulerError& e) {
        std::cerr << "Scheduler error: " << e.what() << std::endl;
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
