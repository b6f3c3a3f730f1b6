#ifndef LGRAPH_LABEL_GRAPH_HPP
#define LGRAPH_LABEL_GRAPH_HPP

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <nlohmann/json.hpp>

namespace lgraph {

using VertexId = std::string;
using LabelId = std::string;

/**
 * @brief Reserved label given to every vertex on creation
 *
 * The leading NUL keeps it out of reach of any label a record reader can
 * produce, so it never collides with a real class.
 */
inline const LabelId kDummyLabel{"\0__DUMMY__", 10};

inline bool is_dummy_label(const LabelId& label) { return label == kDummyLabel; }

/**
 * @brief A weighted edge record as produced by a record source
 */
struct Edge {
    VertexId source;
    VertexId target;
    double weight = 1.0;
};

/**
 * @brief A (vertex, label, score) assertion
 *
 * Used for seed labels, test labels and gold labels alike.
 */
struct Seed {
    VertexId vertex;
    LabelId label;
    double score = 1.0;
};

/**
 * @brief A node of the label-propagation graph
 *
 * Adjacency is kept by identifier; a vertex never points at another vertex.
 */
struct Vertex {
    VertexId id;

    std::map<VertexId, double> neighbors;          // Outgoing edge weights
    std::map<LabelId, double> gold_labels;         // Ground truth for evaluation
    std::map<LabelId, double> injected_labels;     // Supervision visible to propagation
    std::map<LabelId, double> estimated_labels;    // Starts as {kDummyLabel: 1.0}

    bool is_seed = false;
    bool is_test = false;

    // Random-walk model, filled by compute_random_walk_probabilities()
    std::map<VertexId, double> transition;
    bool has_transition = false;
    double p_continue = 0.0;
    double p_inject = 0.0;
    double p_abandon = 0.0;

    size_t degree() const { return neighbors.size(); }

    /**
     * @brief Sum of outgoing edge weights
     */
    double total_weight() const;

    /**
     * @brief Largest outgoing edge weight, 0 for a vertex with no neighbors
     */
    double max_weight() const;

    /**
     * @brief Entropy (natural log) of the normalized outgoing weights
     * @return 0 for a vertex with no outgoing weight
     */
    double neighbor_entropy() const;

    void add_neighbor(const VertexId& target, double weight) { neighbors[target] = weight; }

    void set_gold_label(const LabelId& label, double score) { gold_labels[label] = score; }

    void set_injected_label(const LabelId& label, double score) { injected_labels[label] = score; }

    bool has_injected_label(const LabelId& label) const {
        return injected_labels.find(label) != injected_labels.end();
    }

    /**
     * @brief Drop the derived random-walk state
     */
    void clear_transition();
};

/**
 * @brief Summary of the assembled graph
 */
struct GraphStatistics {
    size_t num_vertices = 0;
    size_t num_edges = 0;                 // Directed adjacency entries
    size_t num_seed_vertices = 0;
    size_t num_test_vertices = 0;
    size_t num_isolated_vertices = 0;
    size_t num_gold_labeled_vertices = 0;

    double avg_degree = 0.0;
    size_t max_degree = 0;

    std::map<LabelId, size_t> injected_per_label;
    bool seed_injected = false;

    nlohmann::json to_json() const;
};

/**
 * @brief Mutable vertex store for label propagation
 *
 * Vertices are created on demand and never removed; transforms edit the
 * adjacency maps in place.
 */
class LabelGraph {
public:
    LabelGraph() = default;

    /**
     * @brief Return the vertex with this id, creating it if needed
     *
     * New vertices start with the dummy label as their only estimate.
     */
    Vertex& add_vertex(const VertexId& id);

    Vertex* get_vertex(const VertexId& id);
    const Vertex* get_vertex(const VertexId& id) const;

    bool has_vertex(const VertexId& id) const;

    size_t num_vertices() const { return vertices_.size(); }

    /**
     * @brief Number of directed adjacency entries
     */
    size_t num_edges() const;

    bool empty() const { return vertices_.empty(); }

    std::vector<VertexId> get_vertex_ids() const;

    /**
     * @brief Direct access to the vertex map, for in-place transforms
     */
    std::map<VertexId, Vertex>& vertices() { return vertices_; }
    const std::map<VertexId, Vertex>& vertices() const { return vertices_; }

    void for_each_vertex(const std::function<void(const Vertex&)>& fn) const;

    bool is_seed_injected() const { return seed_injected_; }
    void set_seed_injected(bool injected = true) { seed_injected_ = injected; }

    /**
     * @brief Number of vertices currently carrying each injected label
     */
    std::map<LabelId, size_t> count_injected_labels() const;

    GraphStatistics compute_statistics() const;

    void clear();

private:
    std::map<VertexId, Vertex> vertices_;
    bool seed_injected_ = false;
};

} // namespace lgraph

#endif // LGRAPH_LABEL_GRAPH_HPP
