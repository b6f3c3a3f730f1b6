#include "cli/cli.hpp"
#include "graph/label_graph.hpp"
#include "io/record_reader.hpp"
#include "pipeline/graph_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using namespace lgraph;

// ============== Helper Functions ==============

// Command-line values override the config file
PipelineConfig resolve_config(const Args& args) {
    PipelineConfig config;
    if (args.has("config")) {
        config = PipelineConfig::from_json_file(args.require("config"));
    }

    if (args.has("graph")) config.graph_files = RecordReader::split_file_list(args.require("graph"));
    if (args.has("seeds")) config.seed_files = RecordReader::split_file_list(args.require("seeds"));
    if (args.has("test")) config.test_file = args.require("test");
    if (args.has("gold")) config.gold_labels_file = args.require("gold");

    if (args.has("directed")) config.is_directed = true;
    if (args.has("max-seeds")) config.max_seeds_per_class = args.get("max-seeds").as_size();
    if (args.has("prune")) config.prune_threshold = args.get("prune").as_size();
    if (args.has("sigma")) {
        config.set_gaussian_kernel_weights = true;
        config.gauss_sigma_factor = args.get("sigma").as_double();
    }
    if (args.has("top-k")) config.top_k_neighbors = args.get("top-k").as_size();
    if (args.has("beta")) config.beta = args.get("beta").as_double();
    if (args.has("train-fract")) config.train_fraction = args.get("train-fract").as_double();
    if (args.has("split-seed")) config.split_seed = args.get("split-seed").as_size();
    if (args.has("quiet")) config.verbose = false;

    return config;
}

nlohmann::json describe_vertex(const Vertex& vertex) {
    nlohmann::json j;
    j["id"] = vertex.id;
    j["neighbors"] = vertex.neighbors;
    j["gold_labels"] = vertex.gold_labels;
    j["injected_labels"] = vertex.injected_labels;
    j["is_seed"] = vertex.is_seed;
    j["is_test"] = vertex.is_test;
    j["transition"] = vertex.transition;
    j["p_continue"] = vertex.p_continue;
    j["p_inject"] = vertex.p_inject;
    j["p_abandon"] = vertex.p_abandon;
    return j;
}

// ============== lgraph build ==============
int cmd_build(const Args& args) {
    PipelineConfig config = resolve_config(args);
    GraphPipeline pipeline(config);

    LabelGraph graph = pipeline.run_from_files();
    PipelineStatistics stats = pipeline.get_statistics();

    if (config.verbose) {
        stats.print_summary();
    }

    if (args.has("stats-output")) {
        std::string path = args.require("stats-output");
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + path);
        }
        file << stats.to_json().dump(2);
        if (config.verbose) {
            std::cout << "\nSaved statistics to: " << path << "\n";
        }
    }

    if (args.has("vertex")) {
        std::string id = args.require("vertex");
        const Vertex* vertex = graph.get_vertex(id);
        if (!vertex) {
            std::cerr << "Vertex not found: " << id << "\n";
            return kExitFailure;
        }
        std::cout << describe_vertex(*vertex).dump(2) << "\n";
    }

    return kExitOk;
}

// ============== lgraph config ==============
int cmd_config(const Args& args) {
    std::string output = args.require("output");
    PipelineConfig config = create_default_config();

    std::string error;
    if (!config.validate(error)) {
        throw ConfigurationError(error);
    }

    config.to_json_file(output);
    std::cout << "Wrote default configuration to: " << output << "\n";
    return kExitOk;
}

// ============== main ==============
int main(int argc, char** argv) {
    CLI cli("lgraph", "1.0.0");

    cli.register_command({
        "build",
        "Build a label propagation graph and its random-walk model",
        {
            {"config", "JSON configuration file"},
            {"graph", "Comma-separated edge files (source, target, weight)"},
            {"seeds", "Comma-separated seed files (vertex, label, score)"},
            {"test", "Test label file"},
            {"gold", "Gold label file"},
            {"directed", "Treat edges as directed", false, true},
            {"max-seeds", "Maximum injected seeds per label"},
            {"prune", "Drop edges of vertices with fewer neighbors than this"},
            {"sigma", "Apply Gaussian kernel weights with this sigma factor"},
            {"top-k", "Keep the k heaviest neighbors of each vertex"},
            {"beta", "Random-walk regularization constant"},
            {"train-fract", "Resplit gold labels with this train fraction"},
            {"split-seed", "Random seed for the split"},
            {"stats-output", "Write statistics JSON to this file"},
            {"vertex", "Print the final state of one vertex"},
            {"quiet", "Suppress progress output", false, true}
        },
        cmd_build
    });

    cli.register_command({
        "config",
        "Write a default configuration file",
        {
            {"output", "Output JSON path", true}
        },
        cmd_config
    });

    return cli.run(argc, argv);
}
