#pragma once

#include "graph/label_graph.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lgraph {

/**
 * @brief Result of a random-walk probability pass
 *
 * Vertices with no outgoing weight are not an error; they are listed here so
 * callers can report them.
 */
struct RandomWalkReport {
    size_t vertices_processed = 0;
    std::vector<VertexId> degenerate_vertices;   // Zero outgoing weight

    nlohmann::json to_json() const;
};

// ==========================================
// Edge weight transforms
// ==========================================

/**
 * @brief Replace every edge weight w with exp(-w / (2 * sigma_factor^2))
 * @param graph Graph whose weights are squared distances
 * @param sigma_factor Kernel width
 *
 * Applying this twice corrupts the weights; callers run it once.
 * @throws ConfigurationError if sigma_factor is not positive
 */
void set_gaussian_weights(LabelGraph& graph, double sigma_factor);

/**
 * @brief Keep only the k heaviest outgoing edges of every vertex
 *
 * Ties are broken by ascending neighbor id. Each vertex is filtered on its
 * own, so an undirected graph can become asymmetric.
 *
 * @throws std::invalid_argument on a negative or non-finite edge weight
 */
void keep_top_k_neighbors(LabelGraph& graph, size_t k);

/**
 * @brief Remove all outgoing edges of vertices whose degree is below threshold
 * @return Number of vertices that lost their edges
 *
 * Degrees are read from the graph as it is when called. Vertices are kept.
 */
size_t prune_low_degree_vertices(LabelGraph& graph, size_t threshold);

// ==========================================
// Random-walk model
// ==========================================

/**
 * @brief Per-vertex continue / inject / abandon split
 */
struct WalkProbabilities {
    double p_continue = 0.0;
    double p_inject = 0.0;
    double p_abandon = 1.0;
};

/**
 * @brief Compute the modified-adsorption probabilities of one vertex
 * @param entropy Entropy of the vertex's normalized outgoing weights
 * @param has_injected_labels Whether the vertex carries supervision
 * @param beta Regularization constant, > 0
 *
 *   c = clamp(ln(beta) / ln(beta + e^entropy), 0, 1)
 *   d = (1 - c) * sqrt(entropy) for labeled vertices, else 0
 *   z = max(c + d, 1)
 *   p_continue = c / z, p_inject = d / z, p_abandon = 1 - p_continue - p_inject
 *
 * p_continue grows with beta. This is for vertices with outgoing weight;
 * isolated vertices are handled by compute_random_walk_probabilities().
 */
WalkProbabilities compute_walk_probabilities(double entropy, bool has_injected_labels, double beta);

/**
 * @brief Derive transition probabilities for every vertex
 * @param graph Graph with its final edge weights and injected labels
 * @param beta Regularization constant, > 0
 *
 * transition[n] = p_continue * w(v, n) / W(v). Isolated vertices get no
 * transitions and put all mass on injection (when labeled) or abandonment.
 * Safe to re-run after any change to weights or seeds.
 *
 * @throws ConfigurationError if beta is not positive
 * @throws std::invalid_argument on a negative or non-finite edge weight
 */
RandomWalkReport compute_random_walk_probabilities(LabelGraph& graph, double beta);

} // namespace lgraph
