#include "graph/label_graph.hpp"
#include <algorithm>
#include <cmath>

namespace lgraph {

// ==========================================
// Vertex Implementation
// ==========================================

double Vertex::total_weight() const {
    double total = 0.0;
    for (const auto& [id, weight] : neighbors) {
        total += weight;
    }
    return total;
}

double Vertex::max_weight() const {
    double heaviest = 0.0;
    for (const auto& [id, weight] : neighbors) {
        heaviest = std::max(heaviest, weight);
    }
    return heaviest;
}

double Vertex::neighbor_entropy() const {
    double heaviest = max_weight();
    if (heaviest <= 0.0) {
        return 0.0;
    }

    // Weights are scaled by the heaviest edge before summing to avoid overflow
    double total = 0.0;
    for (const auto& [id, weight] : neighbors) {
        total += weight / heaviest;
    }

    double entropy = 0.0;
    for (const auto& [id, weight] : neighbors) {
        double p = (weight / heaviest) / total;
        if (p > 0.0) {
            entropy -= p * std::log(p);
        }
    }
    // Rounding can leave a tiny negative value for a single neighbor
    return std::max(entropy, 0.0);
}

void Vertex::clear_transition() {
    transition.clear();
    has_transition = false;
    p_continue = 0.0;
    p_inject = 0.0;
    p_abandon = 0.0;
}

// ==========================================
// GraphStatistics Implementation
// ==========================================

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["num_vertices"] = num_vertices;
    j["num_edges"] = num_edges;
    j["num_seed_vertices"] = num_seed_vertices;
    j["num_test_vertices"] = num_test_vertices;
    j["num_isolated_vertices"] = num_isolated_vertices;
    j["num_gold_labeled_vertices"] = num_gold_labeled_vertices;
    j["avg_degree"] = avg_degree;
    j["max_degree"] = max_degree;
    j["injected_per_label"] = injected_per_label;
    j["seed_injected"] = seed_injected;
    return j;
}

// ==========================================
// LabelGraph Implementation
// ==========================================

Vertex& LabelGraph::add_vertex(const VertexId& id) {
    auto it = vertices_.find(id);
    if (it != vertices_.end()) {
        return it->second;
    }

    Vertex vertex;
    vertex.id = id;
    vertex.estimated_labels[kDummyLabel] = 1.0;
    return vertices_.emplace(id, std::move(vertex)).first->second;
}

Vertex* LabelGraph::get_vertex(const VertexId& id) {
    auto it = vertices_.find(id);
    return it != vertices_.end() ? &it->second : nullptr;
}

const Vertex* LabelGraph::get_vertex(const VertexId& id) const {
    auto it = vertices_.find(id);
    return it != vertices_.end() ? &it->second : nullptr;
}

bool LabelGraph::has_vertex(const VertexId& id) const {
    return vertices_.find(id) != vertices_.end();
}

size_t LabelGraph::num_edges() const {
    size_t count = 0;
    for (const auto& [id, vertex] : vertices_) {
        count += vertex.neighbors.size();
    }
    return count;
}

std::vector<VertexId> LabelGraph::get_vertex_ids() const {
    std::vector<VertexId> ids;
    ids.reserve(vertices_.size());
    for (const auto& [id, _] : vertices_) {
        ids.push_back(id);
    }
    return ids;
}

void LabelGraph::for_each_vertex(const std::function<void(const Vertex&)>& fn) const {
    for (const auto& [_, vertex] : vertices_) {
        fn(vertex);
    }
}

std::map<LabelId, size_t> LabelGraph::count_injected_labels() const {
    std::map<LabelId, size_t> counts;
    for (const auto& [_, vertex] : vertices_) {
        for (const auto& [label, score] : vertex.injected_labels) {
            counts[label]++;
        }
    }
    return counts;
}

GraphStatistics LabelGraph::compute_statistics() const {
    GraphStatistics stats;
    stats.num_vertices = vertices_.size();
    stats.seed_injected = seed_injected_;

    for (const auto& [_, vertex] : vertices_) {
        size_t degree = vertex.degree();
        stats.num_edges += degree;
        stats.max_degree = std::max(stats.max_degree, degree);

        if (degree == 0) stats.num_isolated_vertices++;
        if (vertex.is_seed) stats.num_seed_vertices++;
        if (vertex.is_test) stats.num_test_vertices++;
        if (!vertex.gold_labels.empty()) stats.num_gold_labeled_vertices++;
    }

    if (stats.num_vertices > 0) {
        stats.avg_degree = static_cast<double>(stats.num_edges) / stats.num_vertices;
    }

    stats.injected_per_label = count_injected_labels();

    return stats;
}

void LabelGraph::clear() {
    vertices_.clear();
    seed_injected_ = false;
}

} // namespace lgraph
