#pragma once

#include "graph/label_graph.hpp"
#include "graph/graph_builder.hpp"
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lgraph {

// ============================================================================
// Pipeline Configuration
// ============================================================================

/**
 * @brief Typed configuration for graph construction
 *
 * Optional steps are enabled by giving their parameter a value.
 */
struct PipelineConfig {
    // Record sources
    std::vector<std::string> graph_files;       ///< Edge files, read in order
    std::vector<std::string> seed_files;        ///< Seed label files
    std::string test_file;                      ///< Test labels (optional)
    std::string gold_labels_file;               ///< Extra gold labels (optional)

    // Graph construction
    bool is_directed = false;
    size_t max_seeds_per_class = std::numeric_limits<size_t>::max();
    std::optional<size_t> prune_threshold;      ///< Drop edges of vertices below this degree

    // Weighting
    bool set_gaussian_kernel_weights = false;   ///< Treat weights as squared distances
    std::optional<double> gauss_sigma_factor;   ///< Required with Gaussian weights
    std::optional<size_t> top_k_neighbors;      ///< Keep k heaviest edges per vertex
    double beta = 2.0;                          ///< Random-walk regularization

    // Train/test split
    std::optional<double> train_fraction;       ///< Resplit gold labels when set
    uint64_t split_seed = 0;

    // Output
    bool verbose = true;

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be read
     * @throws ConfigurationError if a key has the wrong type
     */
    static PipelineConfig from_json_file(const std::string& path);

    static PipelineConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    void to_json_file(const std::string& path) const;

    /**
     * @brief Validate configuration
     * @param error_message Set to the first problem found
     * @return true if every requested step has usable parameters
     */
    bool validate(std::string& error_message) const;
};

// ============================================================================
// Pipeline Input / Statistics
// ============================================================================

/**
 * @brief Records handed to the pipeline, already parsed
 */
struct PipelineInput {
    std::vector<Edge> edges;
    std::vector<Seed> seeds;
    std::vector<Seed> test_labels;
    std::vector<Seed> gold_labels;
};

/**
 * @brief Statistics from pipeline execution
 *
 * Counters accumulate across run() calls until reset_statistics(); `graph`
 * describes the most recent result.
 */
struct PipelineStatistics {
    // Records
    size_t edge_records = 0;
    size_t seed_records = 0;
    size_t test_records = 0;
    size_t gold_records = 0;

    // Construction
    size_t labels_injected = 0;
    size_t labels_capped = 0;
    size_t seeds_dropped = 0;
    size_t gold_labels_skipped = 0;
    size_t vertices_pruned = 0;

    // Split
    bool split_applied = false;
    size_t split_train = 0;
    size_t split_test = 0;

    // Random walk
    std::vector<VertexId> degenerate_vertices;

    // Timing
    double total_time_seconds = 0.0;
    double read_time_seconds = 0.0;
    double build_time_seconds = 0.0;
    double weighting_time_seconds = 0.0;

    GraphStatistics graph;

    void print_summary() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

// ============================================================================
// Graph Pipeline
// ============================================================================

/**
 * @brief Builds a propagation-ready graph from records
 *
 * Steps, in order: adjacency, seed injection, test nodes, gold labels,
 * degree pruning, Gaussian weights, top-K, train/test split, random-walk
 * probabilities. Optional steps run only when configured.
 */
class GraphPipeline {
public:
    /**
     * @brief Constructor
     * @throws ConfigurationError if the configuration does not validate
     */
    explicit GraphPipeline(const PipelineConfig& config);

    /**
     * @brief Build the graph from in-memory records
     * @throws ReferenceError if a test label names an unknown vertex
     */
    LabelGraph run(const PipelineInput& input);

    /**
     * @brief Read the configured files, then build the graph
     * @throws ConfigurationError if no graph file is configured
     * @throws std::runtime_error on unreadable or malformed files
     */
    LabelGraph run_from_files();

    /**
     * @brief Read the configured record files
     */
    PipelineInput read_inputs();

    void set_progress_callback(ProgressCallback callback);

    PipelineStatistics get_statistics() const { return stats_; }

    void reset_statistics();

    PipelineConfig get_config() const { return config_; }

    /**
     * @brief Update configuration
     * @throws ConfigurationError if the new configuration does not validate
     */
    void set_config(const PipelineConfig& config);

private:
    PipelineConfig config_;
    PipelineStatistics stats_;
    ProgressCallback progress_callback_;

    void build_graph(LabelGraph& graph, const PipelineInput& input);

    void apply_weighting(LabelGraph& graph);

    void report_progress(
        const std::string& stage,
        int current,
        int total,
        const std::string& message = ""
    );

    void warn(const std::string& message) const;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Create default pipeline configuration
 */
PipelineConfig create_default_config();

} // namespace lgraph
