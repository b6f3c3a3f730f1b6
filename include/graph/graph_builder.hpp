#pragma once

#include "graph/label_graph.hpp"
#include <string>
#include <vector>
#include <map>

namespace lgraph {

/**
 * @brief Running count of injected seeds per label
 *
 * Owned by the caller so repeated injections share (or reset) the cap.
 */
using SeedCounts = std::map<LabelId, size_t>;

/**
 * @brief Outcome of a seed injection pass
 */
struct InjectionReport {
    size_t records_seen = 0;
    size_t labels_injected = 0;
    size_t capped = 0;              // Gold label set, injection refused by cap or duplicate
    size_t dropped_unknown = 0;     // Vertex not in the graph
};

/**
 * @brief Add every edge to the adjacency of the graph
 * @param graph Graph to extend
 * @param edges Edge records, in order
 * @param directed If false each edge is also added target -> source
 *
 * Endpoints are created on demand. A repeated (source, target) pair
 * overwrites the earlier weight; weights are never summed.
 */
void build_adjacency(LabelGraph& graph, const std::vector<Edge>& edges, bool directed);

/**
 * @brief Inject seed labels under a per-label cap
 * @param graph Graph whose vertices receive the labels
 * @param seeds Seed records, in order
 * @param max_seeds_per_class Maximum number of vertices injected with any one label
 * @param counts Per-label counts carried in and updated
 * @return Counts of what happened to the records
 *
 * Every seed on a known vertex sets its gold label. The label is also
 * injected (and the vertex marked as seed) while the label's count is below
 * the cap and the vertex does not carry it yet. Seeds for unknown vertices
 * are dropped. A non-empty seed list sets the graph's seed_injected flag.
 */
InjectionReport inject_seed_labels(
    LabelGraph& graph,
    const std::vector<Seed>& seeds,
    size_t max_seeds_per_class,
    SeedCounts& counts
);

/**
 * @brief Convenience overload starting from zero counts
 */
InjectionReport inject_seed_labels(
    LabelGraph& graph,
    const std::vector<Seed>& seeds,
    size_t max_seeds_per_class
);

/**
 * @brief Mark the vertices used during evaluation
 *
 * Sets the gold label and the test flag.
 * @throws ReferenceError if a record names a vertex not in the graph
 */
void mark_test_nodes(LabelGraph& graph, const std::vector<Seed>& test_labels);

/**
 * @brief Set gold labels without touching injection or flags
 * @return Number of records skipped because the vertex is unknown
 */
size_t assign_gold_labels(LabelGraph& graph, const std::vector<Seed>& gold_labels);

} // namespace lgraph
