#include "pipeline/graph_pipeline.hpp"
#include "graph/errors.hpp"
#include "io/record_reader.hpp"
#include "split/split_generator.hpp"
#include "weighting/weighting_engine.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Config values may be JSON scalars or, as in older key/value configs, strings.

double read_double(const json& j, const std::string& key) {
    const json& value = j.at(key);
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        size_t consumed = 0;
        try {
            double parsed = std::stod(text, &consumed);
            if (consumed == text.size()) return parsed;
        } catch (const std::exception& e) {
            throw lgraph::ConfigurationError("Config key '" + key + "' must be a number: " + e.what());
        }
    }
    throw lgraph::ConfigurationError("Config key '" + key + "' must be a number");
}

size_t read_size(const json& j, const std::string& key) {
    const json& value = j.at(key);
    if (value.is_number_unsigned()) return value.get<size_t>();
    if (value.is_number_integer() && value.get<long long>() >= 0) {
        return static_cast<size_t>(value.get<long long>());
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (!text.empty() && text.find_first_not_of("0123456789") == std::string::npos) {
            try {
                return static_cast<size_t>(std::stoull(text));
            } catch (const std::out_of_range&) {
                throw lgraph::ConfigurationError("Config key '" + key + "' is out of range: " + text);
            }
        }
    }
    throw lgraph::ConfigurationError("Config key '" + key + "' must be a non-negative integer");
}

bool read_bool(const json& j, const std::string& key) {
    const json& value = j.at(key);
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text == "true") return true;
        if (text == "false") return false;
    }
    throw lgraph::ConfigurationError("Config key '" + key + "' must be true or false");
}

std::string read_string(const json& j, const std::string& key) {
    const json& value = j.at(key);
    if (!value.is_string()) {
        throw lgraph::ConfigurationError("Config key '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

// A file list is either "a.tsv,b.tsv" or ["a.tsv", "b.tsv"]
std::vector<std::string> read_file_list(const json& j, const std::string& key) {
    const json& value = j.at(key);
    if (value.is_string()) {
        return lgraph::RecordReader::split_file_list(value.get<std::string>());
    }
    if (value.is_array()) {
        std::vector<std::string> files;
        for (const auto& item : value) {
            if (!item.is_string()) {
                throw lgraph::ConfigurationError("Config key '" + key + "' must list file names");
            }
            files.push_back(item.get<std::string>());
        }
        return files;
    }
    throw lgraph::ConfigurationError("Config key '" + key + "' must be a string or an array");
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

namespace lgraph {

// ============================================================================
// PipelineConfig
// ============================================================================

PipelineConfig PipelineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    return from_json(j);
}

PipelineConfig PipelineConfig::from_json(const json& j) {
    PipelineConfig config;

    // Record sources
    if (j.contains("graph_file")) config.graph_files = read_file_list(j, "graph_file");
    if (j.contains("seed_file")) config.seed_files = read_file_list(j, "seed_file");
    if (j.contains("test_file")) config.test_file = read_string(j, "test_file");
    if (j.contains("gold_labels_file")) config.gold_labels_file = read_string(j, "gold_labels_file");

    // Graph construction
    if (j.contains("is_directed")) config.is_directed = read_bool(j, "is_directed");
    if (j.contains("max_seeds_per_class")) config.max_seeds_per_class = read_size(j, "max_seeds_per_class");
    if (j.contains("prune_threshold")) config.prune_threshold = read_size(j, "prune_threshold");

    // Weighting
    if (j.contains("set_gaussian_kernel_weights")) {
        config.set_gaussian_kernel_weights = read_bool(j, "set_gaussian_kernel_weights");
    }
    if (j.contains("gauss_sigma_factor")) config.gauss_sigma_factor = read_double(j, "gauss_sigma_factor");
    if (j.contains("top_k_neighbors")) config.top_k_neighbors = read_size(j, "top_k_neighbors");
    if (j.contains("beta")) config.beta = read_double(j, "beta");

    // Split
    if (j.contains("train_fract")) config.train_fraction = read_double(j, "train_fract");
    if (j.contains("split_seed")) config.split_seed = read_size(j, "split_seed");

    if (j.contains("verbose")) config.verbose = read_bool(j, "verbose");

    return config;
}

json PipelineConfig::to_json() const {
    json j;

    j["graph_file"] = graph_files;
    j["seed_file"] = seed_files;
    if (!test_file.empty()) j["test_file"] = test_file;
    if (!gold_labels_file.empty()) j["gold_labels_file"] = gold_labels_file;

    j["is_directed"] = is_directed;
    if (max_seeds_per_class != std::numeric_limits<size_t>::max()) {
        j["max_seeds_per_class"] = max_seeds_per_class;
    }
    if (prune_threshold) j["prune_threshold"] = *prune_threshold;

    j["set_gaussian_kernel_weights"] = set_gaussian_kernel_weights;
    if (gauss_sigma_factor) j["gauss_sigma_factor"] = *gauss_sigma_factor;
    if (top_k_neighbors) j["top_k_neighbors"] = *top_k_neighbors;
    j["beta"] = beta;

    if (train_fraction) j["train_fract"] = *train_fraction;
    j["split_seed"] = split_seed;

    j["verbose"] = verbose;

    return j;
}

void PipelineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

bool PipelineConfig::validate(std::string& error_message) const {
    if (!(beta > 0.0)) {
        error_message = "beta must be positive";
        return false;
    }

    if (set_gaussian_kernel_weights) {
        if (!gauss_sigma_factor) {
            error_message = "gauss_sigma_factor is required when set_gaussian_kernel_weights is true";
            return false;
        }
        if (!(*gauss_sigma_factor > 0.0)) {
            error_message = "gauss_sigma_factor must be positive";
            return false;
        }
    }

    if (top_k_neighbors && *top_k_neighbors == 0) {
        error_message = "top_k_neighbors must be at least 1";
        return false;
    }

    if (train_fraction && !(*train_fraction > 0.0 && *train_fraction < 1.0)) {
        error_message = "train_fract must be in (0, 1)";
        return false;
    }

    return true;
}

// ============================================================================
// PipelineStatistics
// ============================================================================

void PipelineStatistics::print_summary() const {
    std::cout << "\n=== Graph Construction Summary ===\n";
    std::cout << "Records:\n";
    std::cout << "  Edges: " << edge_records << "\n";
    std::cout << "  Seeds: " << seed_records << "\n";
    std::cout << "  Test labels: " << test_records << "\n";
    std::cout << "  Gold labels: " << gold_records << "\n";

    std::cout << "\nConstruction:\n";
    std::cout << "  Labels injected: " << labels_injected << "\n";
    std::cout << "  Labels capped: " << labels_capped << "\n";
    std::cout << "  Seeds dropped (unknown vertex): " << seeds_dropped << "\n";
    std::cout << "  Vertices pruned: " << vertices_pruned << "\n";

    if (split_applied) {
        std::cout << "\nSplit:\n";
        std::cout << "  Train vertices: " << split_train << "\n";
        std::cout << "  Test vertices: " << split_test << "\n";
    }

    std::cout << "\nGraph:\n";
    std::cout << "  Vertices: " << graph.num_vertices << "\n";
    std::cout << "  Edges: " << graph.num_edges << "\n";
    std::cout << "  Seed vertices: " << graph.num_seed_vertices << "\n";
    std::cout << "  Test vertices: " << graph.num_test_vertices << "\n";
    std::cout << "  Isolated vertices: " << graph.num_isolated_vertices << "\n";
    std::cout << "  Seed injected: " << (graph.seed_injected ? "true" : "false") << "\n";
    std::cout << "  Zero-weight vertices: " << degenerate_vertices.size() << "\n";

    std::cout << "\nTiming:\n";
    std::cout << "  Total: " << total_time_seconds << "s\n";
    std::cout << "  Reading: " << read_time_seconds << "s\n";
    std::cout << "  Building: " << build_time_seconds << "s\n";
    std::cout << "  Weighting: " << weighting_time_seconds << "s\n";
}

json PipelineStatistics::to_json() const {
    json j;

    j["edge_records"] = edge_records;
    j["seed_records"] = seed_records;
    j["test_records"] = test_records;
    j["gold_records"] = gold_records;

    j["labels_injected"] = labels_injected;
    j["labels_capped"] = labels_capped;
    j["seeds_dropped"] = seeds_dropped;
    j["gold_labels_skipped"] = gold_labels_skipped;
    j["vertices_pruned"] = vertices_pruned;

    j["split_applied"] = split_applied;
    j["split_train"] = split_train;
    j["split_test"] = split_test;

    j["degenerate_vertices"] = degenerate_vertices;

    j["total_time_seconds"] = total_time_seconds;
    j["read_time_seconds"] = read_time_seconds;
    j["build_time_seconds"] = build_time_seconds;
    j["weighting_time_seconds"] = weighting_time_seconds;

    j["graph"] = graph.to_json();

    return j;
}

// ============================================================================
// GraphPipeline
// ============================================================================

GraphPipeline::GraphPipeline(const PipelineConfig& config)
    : config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw ConfigurationError("Invalid configuration: " + error);
    }
}

LabelGraph GraphPipeline::run(const PipelineInput& input) {
    auto start = std::chrono::steady_clock::now();

    LabelGraph graph;

    auto build_start = std::chrono::steady_clock::now();
    build_graph(graph, input);
    stats_.build_time_seconds += seconds_since(build_start);

    auto weighting_start = std::chrono::steady_clock::now();
    apply_weighting(graph);
    stats_.weighting_time_seconds += seconds_since(weighting_start);

    stats_.graph = graph.compute_statistics();
    stats_.total_time_seconds += seconds_since(start);

    return graph;
}

PipelineInput GraphPipeline::read_inputs() {
    if (config_.graph_files.empty()) {
        throw ConfigurationError("Invalid configuration: graph_file is required");
    }

    auto start = std::chrono::steady_clock::now();
    PipelineInput input;

    int total = static_cast<int>(config_.graph_files.size() + config_.seed_files.size());
    int current = 0;

    for (const auto& path : config_.graph_files) {
        report_progress("Reading edges", ++current, total, path);
        auto edges = RecordReader::read_edge_file(path);
        input.edges.insert(input.edges.end(), edges.begin(), edges.end());
    }

    for (const auto& path : config_.seed_files) {
        report_progress("Reading seeds", ++current, total, path);
        auto seeds = RecordReader::read_seed_file(path);
        input.seeds.insert(input.seeds.end(), seeds.begin(), seeds.end());
    }

    if (!config_.test_file.empty()) {
        report_progress("Reading test labels", 1, 1, config_.test_file);
        input.test_labels = RecordReader::read_seed_file(config_.test_file);
    }

    if (!config_.gold_labels_file.empty()) {
        report_progress("Reading gold labels", 1, 1, config_.gold_labels_file);
        input.gold_labels = RecordReader::read_seed_file(config_.gold_labels_file);
    }

    stats_.read_time_seconds += seconds_since(start);
    return input;
}

LabelGraph GraphPipeline::run_from_files() {
    return run(read_inputs());
}

void GraphPipeline::build_graph(LabelGraph& graph, const PipelineInput& input) {
    stats_.edge_records += input.edges.size();
    stats_.seed_records += input.seeds.size();
    stats_.test_records += input.test_labels.size();
    stats_.gold_records += input.gold_labels.size();

    report_progress("Building graph", 1, 1, std::to_string(input.edges.size()) + " edges");
    build_adjacency(graph, input.edges, config_.is_directed);

    if (!input.seeds.empty()) {
        report_progress("Injecting seeds", 1, 1, std::to_string(input.seeds.size()) + " seeds");
        SeedCounts counts;
        InjectionReport injection = inject_seed_labels(
            graph, input.seeds, config_.max_seeds_per_class, counts
        );
        stats_.labels_injected += injection.labels_injected;
        stats_.labels_capped += injection.capped;
        stats_.seeds_dropped += injection.dropped_unknown;

        if (injection.dropped_unknown > 0) {
            warn(std::to_string(injection.dropped_unknown) + " seed(s) name unknown vertices");
        }
    }

    if (!input.test_labels.empty()) {
        report_progress("Marking test nodes", 1, 1);
        mark_test_nodes(graph, input.test_labels);
    }

    if (!input.gold_labels.empty()) {
        report_progress("Setting gold labels", 1, 1);
        size_t skipped = assign_gold_labels(graph, input.gold_labels);
        stats_.gold_labels_skipped += skipped;
        if (skipped > 0) {
            warn(std::to_string(skipped) + " gold label(s) name unknown vertices");
        }
    }

    if (config_.prune_threshold) {
        report_progress("Pruning", 1, 1, "threshold " + std::to_string(*config_.prune_threshold));
        stats_.vertices_pruned += prune_low_degree_vertices(graph, *config_.prune_threshold);
    }
}

void GraphPipeline::apply_weighting(LabelGraph& graph) {
    if (config_.set_gaussian_kernel_weights) {
        report_progress("Gaussian weights", 1, 1);
        set_gaussian_weights(graph, *config_.gauss_sigma_factor);
    }

    if (config_.top_k_neighbors) {
        report_progress("Top-K neighbors", 1, 1, "k = " + std::to_string(*config_.top_k_neighbors));
        keep_top_k_neighbors(graph, *config_.top_k_neighbors);
    }

    if (config_.train_fraction) {
        report_progress("Splitting", 1, 1);
        SplitResult split = split_train_test(
            graph, *config_.train_fraction, config_.max_seeds_per_class, config_.split_seed
        );
        stats_.split_applied = true;
        stats_.split_train += split.train_vertices.size();
        stats_.split_test += split.test_vertices.size();
    }

    report_progress("Random walk probabilities", 1, 1, "beta = " + std::to_string(config_.beta));
    RandomWalkReport walk = compute_random_walk_probabilities(graph, config_.beta);
    stats_.degenerate_vertices.insert(
        stats_.degenerate_vertices.end(),
        walk.degenerate_vertices.begin(), walk.degenerate_vertices.end()
    );

    if (!walk.degenerate_vertices.empty()) {
        warn(std::to_string(walk.degenerate_vertices.size()) +
             " vertex(es) have no outgoing weight");
    }
}

void GraphPipeline::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = callback;
}

void GraphPipeline::reset_statistics() {
    stats_ = PipelineStatistics();
}

void GraphPipeline::set_config(const PipelineConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw ConfigurationError("Invalid configuration: " + error);
    }
    config_ = config;
}

void GraphPipeline::report_progress(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    } else if (config_.verbose && total > 0) {
        std::cout << "[" << stage << "] " << current << "/" << total;
        if (!message.empty()) {
            std::cout << " - " << message;
        }
        std::cout << "\n";
    }
}

void GraphPipeline::warn(const std::string& message) const {
    if (config_.verbose) {
        std::cerr << "Warning: " << message << "\n";
    }
}

// ============================================================================
// Utility Functions
// ============================================================================

PipelineConfig create_default_config() {
    PipelineConfig config;
    config.graph_files = {"graph.tsv"};
    config.seed_files = {"seeds.tsv"};
    return config;
}

} // namespace lgraph
