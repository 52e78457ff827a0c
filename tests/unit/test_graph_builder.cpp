/**
 * @file test_graph_builder.cpp
 * @brief Unit tests for GraphBuilder and TaskGraph.
 */

#include "graph/graph_builder.hpp"
#include "telemetry/json_sink.hpp"

#include "fake_tasks.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <memory>

using namespace taskpipe;
using namespace taskpipe::testing;

namespace {

std::vector<std::string> names_in_order(const TaskGraph& graph) {
    std::vector<std::string> out;
    for (auto index : graph.topological_order()) {
        out.push_back(graph.node(index).task->describe());
    }
    return out;
}

NodeIndex index_of(const TaskGraph& graph, const TaskPtr& task) {
    auto found = graph.find(task);
    EXPECT_TRUE(found.has_value()) << task->describe() << " not in graph";
    return found.value_or(0);
}

}  // namespace

class GraphBuilderTest : public ::testing::Test {
protected:
    std::shared_ptr<Workflow> wf_ = Workflow::create();
};

// ─── Shape ───

TEST_F(GraphBuilderTest, SingleTask) {
    wf_->define("A");
    auto graph = build_graph({wf_->task("A")});
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    EXPECT_EQ(graph->size(), 1u);
    EXPECT_EQ(graph->edge_count(), 0u);
    EXPECT_EQ(graph->node(0).initial_status, NodeStatus::Pending);
}

TEST_F(GraphBuilderTest, EmptyRoots) {
    auto graph = build_graph({});
    ASSERT_TRUE(graph.has_value());
    EXPECT_TRUE(graph->empty());
    EXPECT_TRUE(graph->topological_order().empty());
}

TEST_F(GraphBuilderTest, ChainOrder) {
    wf_->define("C", {"B"});
    wf_->define("B", {"A"});
    wf_->define("A");

    auto graph = build_graph({wf_->task("C")});
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    EXPECT_EQ(graph->size(), 3u);
    EXPECT_EQ(graph->edge_count(), 2u);
    std::vector<std::string> expected{fake_name("A"), fake_name("B"), fake_name("C")};
    EXPECT_EQ(names_in_order(*graph), expected);
}

TEST_F(GraphBuilderTest, DependenciesKeepRequirementOrder) {
    wf_->define("Join", {"Z", "A", "M"});
    wf_->define("Z");
    wf_->define("A");
    wf_->define("M");

    auto graph = build_graph({wf_->task("Join")});
    ASSERT_TRUE(graph.has_value());

    const auto& join = graph->node(index_of(*graph, wf_->task("Join")));
    ASSERT_EQ(join.dependencies.size(), 3u);
    EXPECT_EQ(graph->node(join.dependencies[0]).task->describe(), fake_name("Z"));
    EXPECT_EQ(graph->node(join.dependencies[1]).task->describe(), fake_name("A"));
    EXPECT_EQ(graph->node(join.dependencies[2]).task->describe(), fake_name("M"));
}

TEST_F(GraphBuilderTest, DiamondIsDeduplicated) {
    wf_->define("D", {"B", "C"});
    wf_->define("B", {"A"});
    wf_->define("C", {"A"});
    wf_->define("A");

    auto graph = build_graph({wf_->task("D")});
    ASSERT_TRUE(graph.has_value());

    EXPECT_EQ(graph->size(), 4u);
    EXPECT_EQ(graph->edge_count(), 4u);
    EXPECT_EQ(wf_->count("requirements:A"), 1u);
    EXPECT_TRUE(graph->is_topologically_sorted(graph->topological_order()));

    const auto& a = graph->node(index_of(*graph, wf_->task("A")));
    EXPECT_EQ(a.dependents.size(), 2u);
}

TEST_F(GraphBuilderTest, EqualRootsCollapse) {
    wf_->define("A");
    auto graph = build_graph({wf_->task("A"), wf_->task("A")});
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->size(), 1u);
    EXPECT_EQ(wf_->count("done:A"), 1u);
}

TEST_F(GraphBuilderTest, RepeatedRequirementMerged) {
    wf_->define("B", {"A", "A"});
    wf_->define("A");

    auto graph = build_graph({wf_->task("B")});
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->edge_count(), 1u);
    EXPECT_EQ(graph->node(index_of(*graph, wf_->task("B"))).dependencies.size(), 1u);
}

TEST_F(GraphBuilderTest, RootsAndLeaves) {
    wf_->define("B", {"A"});
    wf_->define("C", {"A"});
    wf_->define("A");

    auto graph = build_graph({wf_->task("B"), wf_->task("C")});
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->roots().size(), 2u);
    ASSERT_EQ(graph->leaves().size(), 1u);
    EXPECT_EQ(graph->node(graph->leaves()[0]).task->describe(), fake_name("A"));
}

// ─── Done pruning ───

TEST_F(GraphBuilderTest, DoneTaskIsNotExpanded) {
    wf_->define("C", {"B"});
    wf_->define("B", {"A"}).done = true;
    wf_->define("A");

    auto graph = build_graph({wf_->task("C")});
    ASSERT_TRUE(graph.has_value());

    EXPECT_EQ(graph->size(), 2u);
    EXPECT_FALSE(graph->find(wf_->task("A")).has_value());
    EXPECT_EQ(wf_->count("requirements:B"), 0u);
    EXPECT_EQ(graph->done_already_count(), 1u);

    const auto& b = graph->node(index_of(*graph, wf_->task("B")));
    EXPECT_TRUE(b.done_already());
    EXPECT_TRUE(b.dependencies.empty());
}

TEST_F(GraphBuilderTest, DoneRootIsSingleNode) {
    wf_->define("A", {"X"}).done = true;
    auto graph = build_graph({wf_->task("A")});
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->size(), 1u);
    EXPECT_EQ(graph->node(0).initial_status, NodeStatus::DoneAlready);
}

// ─── Failures ───

TEST_F(GraphBuilderTest, TwoTaskCycle) {
    wf_->define("A", {"B"});
    wf_->define("B", {"A"});

    auto graph = build_graph({wf_->task("A")});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().kind, ErrorKind::CyclicDependency);
    EXPECT_EQ(graph.error().message,
              "cyclic dependency: " + fake_name("A") + " -> " + fake_name("B") + " -> "
              + fake_name("A"));
}

TEST_F(GraphBuilderTest, SelfCycle) {
    wf_->define("A", {"A"});
    auto graph = build_graph({wf_->task("A")});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().kind, ErrorKind::CyclicDependency);
    EXPECT_EQ(graph.error().task, fake_name("A"));
}

TEST_F(GraphBuilderTest, CycleBehindSharedPrefix) {
    wf_->define("Root", {"A"});
    wf_->define("A", {"B"});
    wf_->define("B", {"C"});
    wf_->define("C", {"A"});

    auto graph = build_graph({wf_->task("Root")});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().kind, ErrorKind::CyclicDependency);
    EXPECT_EQ(graph.error().message.find(fake_name("Root")), std::string::npos);
}

TEST_F(GraphBuilderTest, RevisitingFinishedNodeIsNotACycle) {
    wf_->define("D", {"B", "C"});
    wf_->define("B", {"A"});
    wf_->define("C", {"B"});
    wf_->define("A");

    auto graph = build_graph({wf_->task("D")});
    ASSERT_TRUE(graph.has_value()) << graph.error().message;
    EXPECT_EQ(graph->size(), 4u);
}

TEST_F(GraphBuilderTest, DoneThrowsIsDiscoveryError) {
    wf_->define("B", {"A"});
    wf_->define("A").throw_in_done = true;

    auto graph = build_graph({wf_->task("B")});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().kind, ErrorKind::Discovery);
    EXPECT_EQ(graph.error().task, fake_name("A"));
    EXPECT_NE(graph.error().message.find("done exploded"), std::string::npos);
    EXPECT_THROW(graph.error().rethrow_if_exception(), std::runtime_error);
}

TEST_F(GraphBuilderTest, RequirementsThrowsIsDiscoveryError) {
    wf_->define("A").throw_in_requirements = true;
    auto graph = build_graph({wf_->task("A")});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().kind, ErrorKind::Discovery);
    EXPECT_NE(graph.error().message.find("requirements()"), std::string::npos);
}

TEST_F(GraphBuilderTest, NullRootIsRejected) {
    auto graph = build_graph({nullptr});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().kind, ErrorKind::Discovery);
}

// ─── Logging ───

TEST_F(GraphBuilderTest, LogsSummary) {
    wf_->define("B", {"A"});
    wf_->define("A").done = true;

    auto sink = std::make_shared<MemorySink>();
    GraphBuilder builder(Logger(sink, LogLevel::Debug, "graph"));
    auto graph = builder.build({wf_->task("B")});
    ASSERT_TRUE(graph.has_value());

    EXPECT_TRUE(sink->contains("Graph built: 2 node(s), 1 edge(s), 1 already done"));
    EXPECT_TRUE(sink->contains("already done, not expanded"));
}

// ─── TaskGraph ───

TEST_F(GraphBuilderTest, ManualGraphCycleDetectedByFinalize) {
    wf_->define("A");
    wf_->define("B");

    TaskGraph graph;
    auto a = graph.add_node(wf_->task("A"));
    auto b = graph.add_node(wf_->task("B"));
    graph.add_dependency(a, b);
    graph.add_dependency(b, a);

    auto sorted = graph.finalize();
    ASSERT_FALSE(sorted.has_value());
    EXPECT_EQ(sorted.error().kind, ErrorKind::CyclicDependency);
}

TEST_F(GraphBuilderTest, TopologicalCheckRejectsBadOrder) {
    wf_->define("B", {"A"});
    wf_->define("A");
    auto graph = build_graph({wf_->task("B")});
    ASSERT_TRUE(graph.has_value());

    auto order = graph->topological_order();
    std::reverse(order.begin(), order.end());
    EXPECT_FALSE(graph->is_topologically_sorted(order));
    EXPECT_FALSE(graph->is_topologically_sorted({0}));
}

TEST_F(GraphBuilderTest, DescribeShowsEdges) {
    wf_->define("B", {"A"});
    wf_->define("A").done = true;
    auto graph = build_graph({wf_->task("B")});
    ASSERT_TRUE(graph.has_value());

    auto text = graph->describe();
    EXPECT_NE(text.find("<= " + fake_name("A")), std::string::npos);
    EXPECT_NE(text.find("=> " + fake_name("B")), std::string::npos);
    EXPECT_NE(text.find("[done]"), std::string::npos);
}
