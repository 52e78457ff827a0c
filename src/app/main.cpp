/**
 * @file main.cpp
 * @brief taskpipe_wordcount: word statistics over a set of text files.
 *
 * Wires the library into a complete incremental pipeline:
 *   Config → Logger → GraphBuilder → Scheduler (WorkerPool, ResourcePool) → Telemetry
 *
 * Each input file gets an in-memory CountWords node; one Report node per
 * run writes the combined table. Re-running with the same arguments does
 * nothing once the report exists.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/resource_pool.hpp"
#include "executor/worker_pool.hpp"
#include "graph/graph_builder.hpp"
#include "scheduler/scheduler.hpp"
#include "task/stock_tasks.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace taskpipe;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path;
    std::filesystem::path output = "wordcount.txt";
    std::vector<std::string> inputs;
    bool force = false;
};

void print_usage() {
    std::cout << "Usage: taskpipe_wordcount [OPTIONS] FILE...\n"
              << "  --config <path>    Configuration file (TOML)\n"
              << "  --output <path>    Report file (default: wordcount.txt)\n"
              << "  --force            Rebuild the report even if it exists\n"
              << "  --help, -h         Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output = argv[++i];
        } else if (arg == "--force") {
            args.force = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            args.inputs.push_back(arg);
        }
    }
    return args;
}

// ─────────────────────────────────────────────
// Pipeline tasks
// ─────────────────────────────────────────────

/// Word occurrences of one file, kept in memory until the report is written.
class CountWords final : public MemoryTask<CountWords> {
public:
    static constexpr std::string_view kName = "CountWords";

    explicit CountWords(std::string path) : path_(std::move(path)) {}

    [[nodiscard]] auto fields() const { return std::tie(path_); }

    [[nodiscard]] std::vector<TaskPtr> requirements() const override {
        return {std::make_shared<ExternalTask>(path_)};
    }

    void run(const Inputs& inputs, const RunContext& ctx) const override {
        auto file = std::dynamic_pointer_cast<LocalTarget>(inputs.at(0));
        if (!file) throw std::runtime_error("expected a file input for " + path_);

        std::unique_ptr<Allocation> io;
        if (const auto* pool = ctx.options.find<std::shared_ptr<ResourcePool>>(kResourcesOption);
            pool != nullptr && *pool && (*pool)->total().contains("io")) {
            io = std::move((*pool)->allocate({{"io", 1}}, ctx.stop).value());
        }

        std::istringstream in(file->read_all().value());
        std::map<std::string, size_t> counts;
        for (std::string word; in >> word;) {
            if (ctx.stop.stop_requested()) throw std::runtime_error("interrupted");
            ++counts[word];
        }
        set(std::move(counts)).value();
    }

private:
    std::string path_;
};

/// "<file>\t<words>\t<distinct>" per input, in argument order.
class Report final : public ValueTask<Report> {
public:
    static constexpr std::string_view kName = "Report";

    Report(std::vector<std::string> inputs, std::string output, bool force)
        : inputs_(std::move(inputs)), output_(std::move(output)), force_(force) {}

    /// Identified by its output file alone.
    [[nodiscard]] auto fields() const { return std::tie(output_); }

    [[nodiscard]] std::vector<TaskPtr> requirements() const override {
        std::vector<TaskPtr> out;
        out.reserve(inputs_.size());
        for (const auto& path : inputs_) out.push_back(std::make_shared<CountWords>(path));
        return out;
    }

    [[nodiscard]] TargetPtr output() const override {
        return std::make_shared<LocalTarget>(output_, force_);
    }

    void run(const Inputs& inputs, const RunContext& /*ctx*/) const override {
        auto target = std::static_pointer_cast<LocalTarget>(output());
        auto writer = target->begin_write().value();
        for (size_t i = 0; i < inputs.size(); ++i) {
            auto counts = memory_input<std::map<std::string, size_t>>(inputs[i]);
            size_t total = 0;
            for (const auto& [word, n] : counts) total += n;
            writer->stream() << inputs_[i] << '\t' << total << '\t' << counts.size() << '\n';
        }
        writer->commit().value();
    }

private:
    std::vector<std::string> inputs_;
    std::string output_;
    bool force_;
};

std::shared_ptr<ILogSink> make_log_sink(const LoggingConfig& logging) {
    if (logging.sink == "file") {
        return std::make_shared<JsonFileSink>(logging.log_dir, "taskpipe",
                                              logging.max_file_size_mb, logging.rotate_count);
    }
    if (logging.sink == "null") return std::make_shared<NullSink>();
    return std::make_shared<StdoutSink>();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (args.inputs.empty()) {
        print_usage();
        return 2;
    }

    // Load configuration
    auto config = default_config();
    if (!args.config_path.empty()) {
        auto loaded = load_config(args.config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message << std::endl;
            return 2;
        }
        config = std::move(*loaded);
    }

    // ── Initialize Logger ────────────────────
    Logger logger(make_log_sink(config.logging),
                  parse_log_level(config.logging.level).value_or(LogLevel::Info),
                  "wordcount");
    logger.info("taskpipe_wordcount starting: " + std::to_string(args.inputs.size())
                + " input(s) -> " + args.output.string());

    std::unique_ptr<MetricsCollector> metrics;
    if (config.telemetry.enabled) {
        metrics = std::make_unique<MetricsCollector>(
            std::make_shared<JsonFileSink>(config.telemetry.dir, "metrics"));
    }

    // ── Forwarded options ────────────────────
    auto options = make_run_options(config);
    auto pool = std::make_shared<WorkerPool>(config.executor.worker_threads);
    options.set(kExecutorOption, pool);
    if (!config.resources.empty()) {
        options.set(kResourcesOption, std::make_shared<ResourcePool>(config.resources));
        logger.info("Resources: " + to_string(config.resources));
    }
    logger.info("Executor: " + std::to_string(pool->thread_count()) + " threads");

    // ── Build ────────────────────────────────
    GraphBuilder builder(logger.child("graph"));
    auto graph = builder.build(
        {std::make_shared<Report>(args.inputs, args.output.string(), args.force)});
    if (!graph) {
        logger.error("Graph construction failed: " + graph.error().message);
        logger.flush();
        return 1;
    }

    // ── Run ──────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::stop_source stop_source;
    std::jthread watcher([&stop_source](std::stop_token self) {
        while (!self.stop_requested()) {
            if (g_shutdown_requested) {
                stop_source.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    Scheduler scheduler(logger.child("scheduler"), metrics.get(), config.executor.unit_threads);
    auto report = scheduler.run(*graph, options, stop_source.get_token());
    watcher.request_stop();

    if (!report) {
        logger.error("Scheduler failed: " + report.error().message);
        logger.flush();
        return 1;
    }
    report->log_summary(logger);
    if (report->cancelled) logger.warn("Run interrupted.");

    if (metrics) metrics->flush();
    logger.flush();
    return report->all_ok() ? 0 : 1;
}
