#include <gtest/gtest.h>
#include "weighting/weighting_engine.hpp"
#include "graph/graph_builder.hpp"
#include "graph/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

using namespace lgraph;

namespace {

constexpr double kTolerance = 1e-9;

double transition_sum(const Vertex& v) {
    double sum = 0.0;
    for (const auto& [id, p] : v.transition) sum += p;
    return sum;
}

void expect_normalized(const LabelGraph& graph) {
    graph.for_each_vertex([](const Vertex& v) {
        EXPECT_TRUE(v.has_transition) << v.id;
        EXPECT_GE(v.p_continue, 0.0) << v.id;
        EXPECT_GE(v.p_inject, 0.0) << v.id;
        EXPECT_GE(v.p_abandon, 0.0) << v.id;
        EXPECT_NEAR(v.p_continue + v.p_inject + v.p_abandon, 1.0, kTolerance) << v.id;
        EXPECT_NEAR(transition_sum(v), v.p_continue, kTolerance) << v.id;
        for (const auto& [id, p] : v.transition) {
            EXPECT_GE(p, 0.0);
        }
        if (v.injected_labels.empty()) {
            EXPECT_DOUBLE_EQ(v.p_inject, 0.0) << v.id;
        }
    });
}

}  // namespace

class WeightingTest : public ::testing::Test {
protected:
    LabelGraph graph;

    void SetUp() override {
        build_adjacency(graph, {
            {"a", "b", 1.0},
            {"a", "c", 2.0},
            {"a", "d", 3.0},
            {"a", "e", 3.0},
            {"b", "c", 0.5},
            {"d", "e", 4.0},
            {"f", "a", 0.25}
        }, false);
        inject_seed_labels(graph, {{"a", "L1", 1.0}, {"e", "L2", 1.0}}, 10);
    }
};

// ==========================================
// Gaussian Kernel Tests
// ==========================================

TEST_F(WeightingTest, GaussianKernelValues) {
    set_gaussian_weights(graph, 1.0);

    // exp(-w / 2) for sigma 1
    EXPECT_NEAR(graph.get_vertex("a")->neighbors.at("b"), std::exp(-0.5), 1e-12);
    EXPECT_NEAR(graph.get_vertex("a")->neighbors.at("c"), std::exp(-1.0), 1e-12);
    EXPECT_NEAR(graph.get_vertex("d")->neighbors.at("e"), std::exp(-2.0), 1e-12);
}

TEST_F(WeightingTest, GaussianKernelSigma) {
    set_gaussian_weights(graph, 2.0);
    EXPECT_NEAR(graph.get_vertex("a")->neighbors.at("c"), std::exp(-2.0 / 8.0), 1e-12);
}

TEST(GaussianTest, ZeroDistanceGivesOne) {
    LabelGraph graph;
    build_adjacency(graph, {{"x", "y", 0.0}}, false);
    set_gaussian_weights(graph, 0.7);
    EXPECT_DOUBLE_EQ(graph.get_vertex("x")->neighbors.at("y"), 1.0);
}

TEST_F(WeightingTest, GaussianKernelKeepsSymmetry) {
    set_gaussian_weights(graph, 1.5);
    for (const auto& [id, vertex] : graph.vertices()) {
        for (const auto& [neighbor, weight] : vertex.neighbors) {
            EXPECT_DOUBLE_EQ(weight, graph.get_vertex(neighbor)->neighbors.at(id));
        }
    }
}

TEST_F(WeightingTest, GaussianRejectsBadSigma) {
    EXPECT_THROW(set_gaussian_weights(graph, 0.0), ConfigurationError);
    EXPECT_THROW(set_gaussian_weights(graph, -1.0), ConfigurationError);
    EXPECT_DOUBLE_EQ(graph.get_vertex("a")->neighbors.at("b"), 1.0);
}

// ==========================================
// Top-K Tests
// ==========================================

TEST_F(WeightingTest, TopKMatchesBruteForce) {
    LabelGraph before = graph;
    const size_t k = 2;

    keep_top_k_neighbors(graph, k);

    for (const auto& [id, original] : before.vertices()) {
        std::vector<std::pair<VertexId, double>> sorted(
            original.neighbors.begin(), original.neighbors.end()
        );
        std::sort(sorted.begin(), sorted.end(), [](const auto& x, const auto& y) {
            if (x.second != y.second) return x.second > y.second;
            return x.first < y.first;
        });
        if (sorted.size() > k) sorted.resize(k);

        const Vertex* after = graph.get_vertex(id);
        ASSERT_LE(after->degree(), k);
        ASSERT_EQ(after->degree(), sorted.size());
        for (const auto& [neighbor, weight] : sorted) {
            ASSERT_EQ(after->neighbors.count(neighbor), 1) << id << " -> " << neighbor;
            EXPECT_DOUBLE_EQ(after->neighbors.at(neighbor), weight);
        }
    }
}

TEST_F(WeightingTest, TopKTieBreakByVertexId) {
    // a: b=1, c=2, d=3, e=3, f=0.25. Keeping one of the tied pair picks "d".
    keep_top_k_neighbors(graph, 1);
    const Vertex* a = graph.get_vertex("a");
    ASSERT_EQ(a->degree(), 1);
    EXPECT_EQ(a->neighbors.count("d"), 1);
}

TEST_F(WeightingTest, TopKDoesNotSymmetrize) {
    keep_top_k_neighbors(graph, 1);

    // f only knows a, but a keeps d
    EXPECT_EQ(graph.get_vertex("f")->neighbors.count("a"), 1);
    EXPECT_EQ(graph.get_vertex("a")->neighbors.count("f"), 0);
}

TEST_F(WeightingTest, TopKLeavesSmallVerticesAlone) {
    keep_top_k_neighbors(graph, 10);
    EXPECT_EQ(graph.get_vertex("a")->degree(), 5);
    EXPECT_EQ(graph.num_edges(), 14);
}

// ==========================================
// Pruning Tests
// ==========================================

TEST_F(WeightingTest, PruningIsAllOrNothing) {
    LabelGraph before = graph;
    const size_t threshold = 3;

    size_t pruned = prune_low_degree_vertices(graph, threshold);

    size_t expected_pruned = 0;
    for (const auto& [id, original] : before.vertices()) {
        const Vertex* after = graph.get_vertex(id);
        ASSERT_NE(after, nullptr);
        if (original.degree() < threshold) {
            EXPECT_EQ(after->degree(), 0) << id;
            if (original.degree() > 0) expected_pruned++;
        } else {
            EXPECT_EQ(after->neighbors, original.neighbors) << id;
        }
    }
    EXPECT_EQ(pruned, expected_pruned);
    EXPECT_EQ(graph.num_vertices(), before.num_vertices());
}

TEST_F(WeightingTest, PruningKeepsLabels) {
    prune_low_degree_vertices(graph, 100);
    EXPECT_EQ(graph.num_edges(), 0);
    EXPECT_TRUE(graph.get_vertex("e")->has_injected_label("L2"));
}

TEST_F(WeightingTest, PruningThresholdZeroOrOne) {
    EXPECT_EQ(prune_low_degree_vertices(graph, 0), 0);
    EXPECT_EQ(prune_low_degree_vertices(graph, 1), 0);
    EXPECT_EQ(graph.num_edges(), 14);
}

// ==========================================
// Random Walk Tests
// ==========================================

TEST(WalkProbabilitiesTest, KnownValues) {
    // entropy ln 2, beta 2: c = ln2 / ln4 = 0.5
    auto probs = compute_walk_probabilities(std::log(2.0), true, 2.0);
    EXPECT_NEAR(probs.p_continue, 0.5, 1e-12);
    EXPECT_NEAR(probs.p_inject, 0.5 * std::sqrt(std::log(2.0)), 1e-12);
    EXPECT_NEAR(probs.p_abandon, 1.0 - 0.5 - 0.5 * std::sqrt(std::log(2.0)), 1e-12);
}

TEST(WalkProbabilitiesTest, UnlabeledHasNoInjection) {
    auto probs = compute_walk_probabilities(std::log(2.0), false, 2.0);
    EXPECT_DOUBLE_EQ(probs.p_inject, 0.0);
    EXPECT_NEAR(probs.p_continue + probs.p_abandon, 1.0, kTolerance);
}

TEST(WalkProbabilitiesTest, HighEntropyIsRenormalized) {
    auto probs = compute_walk_probabilities(4.0, true, 2.0);
    EXPECT_NEAR(probs.p_continue + probs.p_inject + probs.p_abandon, 1.0, kTolerance);
    EXPECT_GT(probs.p_inject, probs.p_continue);
    EXPECT_NEAR(probs.p_abandon, 0.0, kTolerance);
}

TEST(WalkProbabilitiesTest, ContinuationGrowsWithBeta) {
    double entropy = std::log(3.0);
    double previous = -1.0;
    for (double beta : {1.0, 1.5, 2.0, 5.0, 20.0, 1000.0}) {
        auto probs = compute_walk_probabilities(entropy, false, beta);
        EXPECT_GT(probs.p_continue, previous);
        previous = probs.p_continue;
    }
}

TEST(WalkProbabilitiesTest, SmallBetaClampsToZero) {
    auto probs = compute_walk_probabilities(0.0, false, 0.5);
    EXPECT_DOUBLE_EQ(probs.p_continue, 0.0);
    EXPECT_DOUBLE_EQ(probs.p_abandon, 1.0);
}

TEST_F(WeightingTest, TransitionsAreNormalized) {
    auto report = compute_random_walk_probabilities(graph, 2.0);
    EXPECT_EQ(report.vertices_processed, graph.num_vertices());
    EXPECT_TRUE(report.degenerate_vertices.empty());
    expect_normalized(graph);
}

TEST_F(WeightingTest, TransitionProportionalToWeight) {
    compute_random_walk_probabilities(graph, 2.0);

    const Vertex* a = graph.get_vertex("a");
    double total = a->total_weight();
    for (const auto& [neighbor, weight] : a->neighbors) {
        EXPECT_NEAR(a->transition.at(neighbor), a->p_continue * weight / total, 1e-12);
    }
}

TEST_F(WeightingTest, LabeledVertexHasInjection) {
    compute_random_walk_probabilities(graph, 2.0);
    EXPECT_GT(graph.get_vertex("a")->p_inject, 0.0);
    EXPECT_DOUBLE_EQ(graph.get_vertex("b")->p_inject, 0.0);
}

TEST_F(WeightingTest, IsolatedVertices) {
    prune_low_degree_vertices(graph, 3);
    auto report = compute_random_walk_probabilities(graph, 2.0);

    std::set<VertexId> degenerate(report.degenerate_vertices.begin(), report.degenerate_vertices.end());
    EXPECT_EQ(degenerate.count("e"), 1);
    EXPECT_EQ(degenerate.count("f"), 1);
    EXPECT_EQ(degenerate.count("a"), 0);

    // e is a seed: all mass on injection
    const Vertex* e = graph.get_vertex("e");
    EXPECT_DOUBLE_EQ(e->p_continue, 0.0);
    EXPECT_DOUBLE_EQ(e->p_inject, 1.0);
    EXPECT_TRUE(e->transition.empty());

    // f is unlabeled: all mass on abandonment
    const Vertex* f = graph.get_vertex("f");
    EXPECT_DOUBLE_EQ(f->p_continue, 0.0);
    EXPECT_DOUBLE_EQ(f->p_abandon, 1.0);

    expect_normalized(graph);
}

TEST_F(WeightingTest, RecomputeIsIdempotent) {
    compute_random_walk_probabilities(graph, 2.0);
    LabelGraph first = graph;
    compute_random_walk_probabilities(graph, 2.0);

    for (const auto& [id, vertex] : graph.vertices()) {
        const Vertex* other = first.get_vertex(id);
        EXPECT_EQ(vertex.transition, other->transition);
        EXPECT_DOUBLE_EQ(vertex.p_inject, other->p_inject);
    }
}

TEST_F(WeightingTest, RecomputeAfterReweighting) {
    compute_random_walk_probabilities(graph, 2.0);
    set_gaussian_weights(graph, 1.0);
    keep_top_k_neighbors(graph, 2);
    compute_random_walk_probabilities(graph, 2.0);

    // Dropped neighbors must not linger in the transition map
    for (const auto& [id, vertex] : graph.vertices()) {
        EXPECT_EQ(vertex.transition.size(), vertex.neighbors.size()) << id;
    }
    expect_normalized(graph);
}

TEST_F(WeightingTest, RandomWalkRejectsBadInput) {
    EXPECT_THROW(compute_random_walk_probabilities(graph, 0.0), ConfigurationError);

    graph.get_vertex("b")->neighbors["c"] = -1.0;
    EXPECT_THROW(compute_random_walk_probabilities(graph, 2.0), std::invalid_argument);
}

TEST_F(WeightingTest, NonFiniteWeightsRejected) {
    LabelGraph infinite = graph;
    infinite.get_vertex("b")->neighbors["c"] = std::numeric_limits<double>::infinity();
    EXPECT_THROW(compute_random_walk_probabilities(infinite, 2.0), std::invalid_argument);
    EXPECT_THROW(keep_top_k_neighbors(infinite, 1), std::invalid_argument);

    LabelGraph nan = graph;
    nan.get_vertex("b")->neighbors["c"] = std::nan("");
    EXPECT_THROW(keep_top_k_neighbors(nan, 1), std::invalid_argument);
    EXPECT_THROW(compute_random_walk_probabilities(nan, 2.0), std::invalid_argument);
}

TEST(WeightingOverflowTest, HugeWeightsStillNormalize) {
    LabelGraph graph;
    build_adjacency(graph, {{"a", "b", 1e308}, {"a", "c", 1e308}}, true);

    compute_random_walk_probabilities(graph, 2.0);

    const Vertex* a = graph.get_vertex("a");
    EXPECT_NEAR(a->neighbor_entropy(), std::log(2.0), 1e-12);
    EXPECT_GT(a->p_continue, 0.0);
    EXPECT_NEAR(a->transition.at("b"), a->p_continue / 2.0, 1e-12);
    EXPECT_NEAR(a->transition.at("c"), a->p_continue / 2.0, 1e-12);
}

TEST_F(WeightingTest, ReportToJson) {
    prune_low_degree_vertices(graph, 3);
    auto json = compute_random_walk_probabilities(graph, 2.0).to_json();
    EXPECT_EQ(json["vertices_processed"], graph.num_vertices());
    EXPECT_EQ(json["num_degenerate_vertices"], json["degenerate_vertices"].size());
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
