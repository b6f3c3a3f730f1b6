#include "split/split_generator.hpp"
#include "graph/errors.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>

namespace lgraph {

nlohmann::json SplitResult::to_json() const {
    nlohmann::json j;
    j["num_train"] = train_vertices.size();
    j["num_test"] = test_vertices.size();
    j["labels_injected"] = injection.labels_injected;
    j["labels_capped"] = injection.capped;
    return j;
}

SplitResult split_train_test(
    LabelGraph& graph,
    double train_fraction,
    size_t max_seeds_per_class,
    uint64_t rng_seed
) {
    if (!(train_fraction > 0.0 && train_fraction < 1.0)) {
        std::ostringstream msg;
        msg << "Train fraction must be in (0, 1), got " << train_fraction;
        throw ConfigurationError(msg.str());
    }

    std::mt19937_64 rng(rng_seed);

    SplitResult result;
    std::vector<VertexId> labeled;

    for (auto& [id, vertex] : graph.vertices()) {
        vertex.injected_labels.clear();
        vertex.is_seed = false;
        vertex.is_test = false;
        if (!vertex.gold_labels.empty()) {
            labeled.push_back(id);
        }
    }

    // Map iteration is ordered by id, so the shuffle is reproducible
    std::shuffle(labeled.begin(), labeled.end(), rng);
    size_t num_train = static_cast<size_t>(
        std::ceil(train_fraction * static_cast<double>(labeled.size()))
    );
    num_train = std::min(num_train, labeled.size());

    std::vector<Seed> train_seeds;
    for (size_t i = 0; i < num_train; ++i) {
        const Vertex* vertex = graph.get_vertex(labeled[i]);
        for (const auto& [label, score] : vertex->gold_labels) {
            train_seeds.push_back(Seed{labeled[i], label, score});
        }
    }

    SeedCounts counts;
    result.injection = inject_seed_labels(graph, train_seeds, max_seeds_per_class, counts);
    graph.set_seed_injected();

    // Vertices the per-class cap refused entirely are evaluated instead
    for (size_t i = 0; i < labeled.size(); ++i) {
        Vertex* vertex = graph.get_vertex(labeled[i]);
        if (i < num_train && vertex->is_seed) {
            result.train_vertices.push_back(labeled[i]);
        } else {
            vertex->is_test = true;
            result.test_vertices.push_back(labeled[i]);
        }
    }
    std::sort(result.train_vertices.begin(), result.train_vertices.end());
    std::sort(result.test_vertices.begin(), result.test_vertices.end());

    return result;
}

} // namespace lgraph
