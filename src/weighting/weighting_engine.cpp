#include "weighting/weighting_engine.hpp"
#include "graph/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace lgraph {

namespace {

// Ranking and normalization both need every weight finite and non-negative
void check_weights(const LabelGraph& graph) {
    for (const auto& [id, vertex] : graph.vertices()) {
        for (const auto& [neighbor, weight] : vertex.neighbors) {
            if (!std::isfinite(weight) || weight < 0.0) {
                throw std::invalid_argument(
                    "Invalid edge weight on " + id + " -> " + neighbor
                );
            }
        }
    }
}

}  // namespace

// ==========================================
// RandomWalkReport Implementation
// ==========================================

nlohmann::json RandomWalkReport::to_json() const {
    nlohmann::json j;
    j["vertices_processed"] = vertices_processed;
    j["num_degenerate_vertices"] = degenerate_vertices.size();
    j["degenerate_vertices"] = degenerate_vertices;
    return j;
}

// ==========================================
// Edge weight transforms
// ==========================================

void set_gaussian_weights(LabelGraph& graph, double sigma_factor) {
    if (!(sigma_factor > 0.0)) {
        throw ConfigurationError("Gaussian sigma factor must be positive");
    }

    const double denominator = 2.0 * sigma_factor * sigma_factor;

    for (auto& [id, vertex] : graph.vertices()) {
        for (auto& [neighbor, weight] : vertex.neighbors) {
            weight = std::exp(-weight / denominator);
        }
    }
}

void keep_top_k_neighbors(LabelGraph& graph, size_t k) {
    check_weights(graph);

    for (auto& [id, vertex] : graph.vertices()) {
        if (vertex.neighbors.size() <= k) {
            continue;
        }

        std::vector<std::pair<VertexId, double>> ranked(
            vertex.neighbors.begin(), vertex.neighbors.end()
        );

        // Heaviest first; equal weights fall back to id order
        std::partial_sort(
            ranked.begin(), ranked.begin() + k, ranked.end(),
            [](const auto& a, const auto& b) {
                if (a.second != b.second) return a.second > b.second;
                return a.first < b.first;
            }
        );

        std::map<VertexId, double> kept;
        for (size_t i = 0; i < k; ++i) {
            kept.emplace(ranked[i].first, ranked[i].second);
        }
        vertex.neighbors = std::move(kept);
    }
}

size_t prune_low_degree_vertices(LabelGraph& graph, size_t threshold) {
    size_t pruned = 0;
    for (auto& [id, vertex] : graph.vertices()) {
        if (vertex.degree() < threshold && !vertex.neighbors.empty()) {
            vertex.neighbors.clear();
            pruned++;
        }
    }
    return pruned;
}

// ==========================================
// Random-walk model
// ==========================================

WalkProbabilities compute_walk_probabilities(double entropy, bool has_injected_labels, double beta) {
    WalkProbabilities probs;

    double c = std::log(beta) / std::log(beta + std::exp(entropy));
    c = std::clamp(c, 0.0, 1.0);

    double d = 0.0;
    if (has_injected_labels) {
        d = (1.0 - c) * std::sqrt(entropy);
    }

    double z = std::max(c + d, 1.0);

    probs.p_continue = c / z;
    probs.p_inject = d / z;
    probs.p_abandon = std::max(0.0, 1.0 - probs.p_continue - probs.p_inject);

    return probs;
}

RandomWalkReport compute_random_walk_probabilities(LabelGraph& graph, double beta) {
    if (!(beta > 0.0)) {
        throw ConfigurationError("Random walk beta must be positive");
    }

    check_weights(graph);

    RandomWalkReport report;

    for (auto& [id, vertex] : graph.vertices()) {
        vertex.clear_transition();
        report.vertices_processed++;

        bool labeled = !vertex.injected_labels.empty();
        double heaviest = vertex.max_weight();

        if (heaviest <= 0.0) {
            report.degenerate_vertices.push_back(id);
            vertex.p_continue = 0.0;
            vertex.p_inject = labeled ? 1.0 : 0.0;
            vertex.p_abandon = labeled ? 0.0 : 1.0;
            vertex.has_transition = true;
            continue;
        }

        WalkProbabilities probs = compute_walk_probabilities(
            vertex.neighbor_entropy(), labeled, beta
        );

        vertex.p_continue = probs.p_continue;
        vertex.p_inject = probs.p_inject;
        vertex.p_abandon = probs.p_abandon;

        // Scale by the heaviest edge so the sum cannot overflow
        double scaled_total = 0.0;
        for (const auto& [neighbor, weight] : vertex.neighbors) {
            scaled_total += weight / heaviest;
        }
        for (const auto& [neighbor, weight] : vertex.neighbors) {
            vertex.transition[neighbor] = probs.p_continue * (weight / heaviest) / scaled_total;
        }
        vertex.has_transition = true;
    }

    return report;
}

} // namespace lgraph
