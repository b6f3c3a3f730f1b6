#include "graph/graph_builder.hpp"
#include "graph/errors.hpp"

namespace lgraph {

void build_adjacency(LabelGraph& graph, const std::vector<Edge>& edges, bool directed) {
    for (const auto& edge : edges) {
        // source -> target
        Vertex& source = graph.add_vertex(edge.source);
        source.add_neighbor(edge.target, edge.weight);

        // The target exists even for a directed edge
        Vertex& target = graph.add_vertex(edge.target);
        if (!directed) {
            target.add_neighbor(edge.source, edge.weight);
        }
    }
}

InjectionReport inject_seed_labels(
    LabelGraph& graph,
    const std::vector<Seed>& seeds,
    size_t max_seeds_per_class,
    SeedCounts& counts
) {
    InjectionReport report;

    for (const auto& seed : seeds) {
        report.records_seen++;

        // operator[] starts an unseen label at zero
        size_t& count = counts[seed.label];

        Vertex* vertex = graph.get_vertex(seed.vertex);
        if (!vertex) {
            report.dropped_unknown++;
            continue;
        }

        vertex->set_gold_label(seed.label, seed.score);

        if (count < max_seeds_per_class && !vertex->has_injected_label(seed.label)) {
            vertex->set_injected_label(seed.label, seed.score);
            vertex->is_seed = true;
            count++;
            report.labels_injected++;
        } else {
            report.capped++;
        }
    }

    if (!seeds.empty()) {
        graph.set_seed_injected();
    }

    return report;
}

InjectionReport inject_seed_labels(
    LabelGraph& graph,
    const std::vector<Seed>& seeds,
    size_t max_seeds_per_class
) {
    SeedCounts counts;
    return inject_seed_labels(graph, seeds, max_seeds_per_class, counts);
}

void mark_test_nodes(LabelGraph& graph, const std::vector<Seed>& test_labels) {
    // Check every reference first so a bad record leaves the graph untouched
    for (const auto& record : test_labels) {
        if (!graph.has_vertex(record.vertex)) {
            throw ReferenceError("Test label references unknown vertex: " + record.vertex);
        }
    }

    for (const auto& record : test_labels) {
        Vertex* vertex = graph.get_vertex(record.vertex);
        vertex->set_gold_label(record.label, record.score);
        vertex->is_test = true;
    }
}

size_t assign_gold_labels(LabelGraph& graph, const std::vector<Seed>& gold_labels) {
    size_t skipped = 0;
    for (const auto& record : gold_labels) {
        Vertex* vertex = graph.get_vertex(record.vertex);
        if (!vertex) {
            skipped++;
            continue;
        }
        vertex->set_gold_label(record.label, record.score);
    }
    return skipped;
}

} // namespace lgraph
