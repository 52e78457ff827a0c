/**
 * @file test_file_pipeline.cpp
 * @brief Integration tests running a small file-processing pipeline end to end:
 *        discovery, scheduling, atomic file outputs, in-memory intermediates
 *        and their cleanup.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "executor/resource_pool.hpp"
#include "executor/worker_pool.hpp"
#include "graph/graph_builder.hpp"
#include "scheduler/scheduler.hpp"
#include "task/stock_tasks.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

using namespace taskpipe;

namespace {

std::shared_ptr<LocalTarget> as_file(const TargetPtr& target) {
    auto file = std::dynamic_pointer_cast<LocalTarget>(target);
    if (!file) throw std::runtime_error("expected a file input, got " + target->describe());
    return file;
}

void write_file(const LocalTarget& target, const std::string& content) {
    auto writer = target.begin_write();
    if (!writer) throw std::runtime_error(writer.error().message);
    (*writer)->stream() << content;
    (*writer)->commit().value();
}

/// Hold the "disk" resource while touching files, when a pool is injected.
std::unique_ptr<Allocation> take_disk(const RunContext& ctx) {
    const auto* pool = ctx.options.find<std::shared_ptr<ResourcePool>>(kResourcesOption);
    if (pool == nullptr || !*pool) return nullptr;
    return std::move((*pool)->allocate({{"disk", 1}}, ctx.stop).value());
}

// ═══════════════════════════════════════════════
// Pipeline tasks
// ═══════════════════════════════════════════════

/// raw text -> upper-cased text file.
class Uppercase final : public ValueTask<Uppercase> {
public:
    static constexpr std::string_view kName = "Uppercase";

    Uppercase(std::string source, std::string dest)
        : source_(std::move(source)), dest_(std::move(dest)) {}

    [[nodiscard]] auto fields() const { return std::tie(source_, dest_); }

    [[nodiscard]] std::vector<TaskPtr> requirements() const override {
        return {std::make_shared<ExternalTask>(source_)};
    }

    [[nodiscard]] TargetPtr output() const override {
        return std::make_shared<LocalTarget>(dest_);
    }

    void run(const Inputs& inputs, const RunContext& ctx) const override {
        auto disk = take_disk(ctx);
        auto text = as_file(inputs.at(0))->read_all().value();
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        write_file(*as_file(output()), text);
    }

private:
    std::string source_;
    std::string dest_;
};

/// Upper-cased text -> words held in memory.
class Tokenize final : public MemoryTask<Tokenize> {
public:
    static constexpr std::string_view kName = "Tokenize";

    Tokenize(std::string source, std::string upper)
        : source_(std::move(source)), upper_(std::move(upper)) {}

    [[nodiscard]] auto fields() const { return std::tie(source_, upper_); }

    [[nodiscard]] std::vector<TaskPtr> requirements() const override {
        return {std::make_shared<Uppercase>(source_, upper_)};
    }

    void run(const Inputs& inputs, const RunContext& /*ctx*/) const override {
        std::istringstream in(as_file(inputs.at(0))->read_all().value());
        std::vector<std::string> words;
        for (std::string word; in >> word;) words.push_back(word);
        set(std::move(words)).value();
    }

private:
    std::string source_;
    std::string upper_;
};

/// Words -> "<count>\n<longest>" summary file.
class Summarize final : public ValueTask<Summarize> {
public:
    static constexpr std::string_view kName = "Summarize";

    Summarize(std::string source, std::string upper, std::string dest, bool fail = false)
        : source_(std::move(source)), upper_(std::move(upper)), dest_(std::move(dest))
        , fail_(fail) {}

    [[nodiscard]] auto fields() const { return std::tie(source_, upper_, dest_, fail_); }

    [[nodiscard]] std::vector<TaskPtr> requirements() const override {
        return {std::make_shared<Tokenize>(source_, upper_)};
    }

    [[nodiscard]] TargetPtr output() const override {
        return std::make_shared<LocalTarget>(dest_);
    }

    void run(const Inputs& inputs, const RunContext& ctx) const override {
        auto words = memory_input<std::vector<std::string>>(inputs.at(0));
        auto longest = std::max_element(words.begin(), words.end(),
            [](const auto& a, const auto& b) { return a.size() < b.size(); });

        auto disk = take_disk(ctx);
        auto writer = as_file(output())->begin_write().value();
        writer->stream() << words.size() << '\n' << (longest == words.end() ? "" : *longest);
        if (fail_) throw std::runtime_error("summary rejected");
        writer->commit().value();
    }

private:
    std::string source_;
    std::string upper_;
    std::string dest_;
    bool fail_;
};

bool contains_name(const std::filesystem::path& dir, const std::string& needle) {
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().find(needle) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

// ═══════════════════════════════════════════════
// File Pipeline Tests
// ═══════════════════════════════════════════════

class FilePipelineTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;
    std::shared_ptr<MemorySink> log_ = std::make_shared<MemorySink>();

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "taskpipe_file_pipeline";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    void write_input(const std::string& text) {
        std::ofstream{dir_ / "raw.txt"} << text;
    }

    std::shared_ptr<Summarize> summary_task(bool fail = false) const {
        return std::make_shared<Summarize>(path("raw.txt"), path("upper.txt"),
                                           path("summary.txt"), fail);
    }

    Result<RunReport> build_and_run(const TaskPtr& root, const RunOptions& options = {}) {
        Logger logger(log_, LogLevel::Debug, "pipeline");
        GraphBuilder builder(logger.child("graph"));
        auto graph = builder.build({root});
        if (!graph) return graph.error();
        graph_ = std::move(*graph);

        Scheduler scheduler(logger.child("scheduler"));
        auto report = scheduler.run(graph_, options);
        if (report) report->log_summary(logger);
        return report;
    }

    TaskGraph graph_;
};

TEST_F(FilePipelineTest, ProducesAllOutputs) {
    write_input("the quick brown fox jumps");

    auto report = build_and_run(summary_task());
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_TRUE(report->all_ok());

    // ExternalTask is done, so only the three derived tasks ran.
    auto summary = report->summary();
    EXPECT_EQ(summary.total, 4u);
    EXPECT_EQ(summary.already_done, 1u);
    EXPECT_EQ(summary.succeeded, 3u);

    EXPECT_EQ(*LocalTarget(dir_ / "upper.txt").read_all(), "THE QUICK BROWN FOX JUMPS");
    EXPECT_EQ(*LocalTarget(dir_ / "summary.txt").read_all(), "5\nQUICK");
    EXPECT_FALSE(contains_name(dir_, "-TMP-"));
    EXPECT_TRUE(log_->contains("All tasks successful"));
}

TEST_F(FilePipelineTest, IntermediateMemoryReleasedAfterConsumer) {
    write_input("a bb ccc");

    auto report = build_and_run(summary_task());
    ASSERT_TRUE(report.has_value());

    auto tokenize = std::make_shared<Tokenize>(path("raw.txt"), path("upper.txt"));
    const auto* outcome = report->find(tokenize);
    ASSERT_NE(outcome, nullptr);
    EXPECT_EQ(outcome->cleanup, CleanupStatus::Succeeded);

    const auto& kept = static_cast<const Tokenize&>(*outcome->task);
    EXPECT_FALSE(kept.memory()->has_value());
}

TEST_F(FilePipelineTest, RerunSkipsCompletedWork) {
    write_input("one two three");
    ASSERT_TRUE(build_and_run(summary_task()).has_value());

    auto before = std::filesystem::last_write_time(dir_ / "upper.txt");
    auto report = build_and_run(summary_task());
    ASSERT_TRUE(report.has_value());

    EXPECT_EQ(graph_.size(), 1u);
    EXPECT_EQ(report->summary().already_done, 1u);
    EXPECT_EQ(report->summary().succeeded, 0u);
    EXPECT_EQ(std::filesystem::last_write_time(dir_ / "upper.txt"), before);
}

TEST_F(FilePipelineTest, DeletedIntermediateIsRebuiltButInputIsNot) {
    write_input("alpha beta");
    ASSERT_TRUE(build_and_run(summary_task()).has_value());

    std::filesystem::remove(dir_ / "summary.txt");
    auto report = build_and_run(summary_task());
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->all_ok());

    // upper.txt still exists, so Uppercase is done and ExternalTask is pruned.
    EXPECT_EQ(graph_.size(), 3u);
    EXPECT_EQ(report->summary().already_done, 1u);
    EXPECT_EQ(report->summary().succeeded, 2u);
}

TEST_F(FilePipelineTest, MissingInputSkipsEverything) {
    auto report = build_and_run(summary_task());
    ASSERT_TRUE(report.has_value());

    auto summary = report->summary();
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.skipped, 3u);

    auto external = std::make_shared<ExternalTask>(path("raw.txt"));
    ASSERT_EQ(report->status_of(external), NodeStatus::Failed);
    const auto* root = report->find(summary_task());
    ASSERT_NE(root, nullptr);
    ASSERT_TRUE(root->error.has_value());
    EXPECT_NE(root->error->root_cause().message.find("does not exist"), std::string::npos);

    EXPECT_FALSE(std::filesystem::exists(dir_ / "upper.txt"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "summary.txt"));
    EXPECT_TRUE(log_->contains("RUN ERRORS"));
}

TEST_F(FilePipelineTest, FailedWriterNeverPublishes) {
    write_input("x y z");
    auto report = build_and_run(summary_task(true));
    ASSERT_TRUE(report.has_value());

    EXPECT_EQ(report->status_of(summary_task(true)), NodeStatus::Failed);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "summary.txt"));
    EXPECT_TRUE(contains_name(dir_, "summary.txt-FAILED-"));

    // The consumed intermediate is still released.
    auto tokenize = std::make_shared<Tokenize>(path("raw.txt"), path("upper.txt"));
    EXPECT_EQ(report->find(tokenize)->cleanup, CleanupStatus::Succeeded);
}

TEST_F(FilePipelineTest, ConfiguredExecutorAndResources) {
    write_input("configured run");

    auto config = parse_config(R"(
        [executor]
        worker_threads = 2

        [resources]
        disk = 1

        [options]
        label = "nightly"
    )");
    ASSERT_TRUE(config.has_value()) << config.error().message;

    auto options = make_run_options(*config);
    options.set(kExecutorOption, std::make_shared<WorkerPool>(config->executor.worker_threads));
    auto resources = std::make_shared<ResourcePool>(config->resources);
    options.set(kResourcesOption, resources);

    auto report = build_and_run(summary_task(), options);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->all_ok());
    EXPECT_EQ(resources->available().at("disk"), 1);
    EXPECT_EQ(*options.get<std::string>("label"), "nightly");
}

TEST_F(FilePipelineTest, TelemetryToRotatingFiles) {
    write_input("telemetry please");

    auto telemetry_dir = dir_ / "telemetry";
    auto sink = std::make_shared<JsonFileSink>(telemetry_dir, "metrics");
    MetricsCollector metrics(sink);

    auto graph = build_graph({summary_task()});
    ASSERT_TRUE(graph.has_value());
    Scheduler scheduler(Logger(std::make_shared<NullSink>()), &metrics);
    ASSERT_TRUE(scheduler.run(*graph, {}).has_value());
    metrics.flush();

    std::ifstream in(telemetry_dir / "metrics.ndjson");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find(R"("event":"run_summary")"), std::string::npos);
}
