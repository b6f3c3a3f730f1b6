#pragma once

#include "graph/label_graph.hpp"
#include "graph/graph_builder.hpp"
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace lgraph {

/**
 * @brief Which gold-labeled vertices went to each side of a split
 */
struct SplitResult {
    std::vector<VertexId> train_vertices;
    std::vector<VertexId> test_vertices;
    InjectionReport injection;

    nlohmann::json to_json() const;
};

/**
 * @brief Randomly partition gold-labeled vertices into seeds and test nodes
 * @param graph Graph with gold labels
 * @param train_fraction Share of gold-labeled vertices sent to train, in (0, 1)
 * @param max_seeds_per_class Cap applied when injecting the train labels
 * @param rng_seed Seed for the generator; equal seeds give equal splits
 *
 * Existing injected labels and seed/test flags are cleared first. The
 * gold-labeled vertices are shuffled and the first ceil(fraction * N) get
 * their gold labels injected through inject_seed_labels(), so the per-label
 * cap holds. Every other gold-labeled vertex, including a train pick whose
 * labels were all refused by the cap, is marked test. Both result lists are
 * sorted by id.
 * The random-walk probabilities must be recomputed afterwards.
 *
 * @throws ConfigurationError if train_fraction is outside (0, 1)
 */
SplitResult split_train_test(
    LabelGraph& graph,
    double train_fraction,
    size_t max_seeds_per_class,
    uint64_t rng_seed
);

} // namespace lgraph
