#pragma once

#include "graph/label_graph.hpp"
#include <istream>
#include <string>
#include <vector>

namespace lgraph {

/**
 * @brief Readers for the tab-separated record files
 *
 * Edge lines:  source <TAB> target <TAB> weight
 * Seed lines:  vertex <TAB> label  <TAB> score
 *
 * Blank lines and lines starting with '#' are skipped. Any other line that
 * does not have exactly three fields with a numeric third field is an error;
 * a file either parses completely or throws.
 */
class RecordReader {
public:
    /**
     * @brief Parse edges from a stream
     * @param input Stream to read
     * @param source_name Name used in error messages
     * @throws std::runtime_error on a malformed line
     */
    static std::vector<Edge> read_edges(std::istream& input, const std::string& source_name = "<stream>");

    static std::vector<Seed> read_seeds(std::istream& input, const std::string& source_name = "<stream>");

    /**
     * @brief Parse an edge file
     * @throws std::runtime_error if the file cannot be opened or a line is malformed
     */
    static std::vector<Edge> read_edge_file(const std::string& path);

    static std::vector<Seed> read_seed_file(const std::string& path);

    /**
     * @brief Read and concatenate several files, in order
     */
    static std::vector<Edge> read_edge_files(const std::vector<std::string>& paths);
    static std::vector<Seed> read_seed_files(const std::vector<std::string>& paths);

    /**
     * @brief Split a comma-separated file list, dropping empty items
     */
    static std::vector<std::string> split_file_list(const std::string& list);

private:
    static std::vector<std::string> split_fields(const std::string& line);
    static double parse_number(const std::string& field, const std::string& source_name, size_t line_number);
};

} // namespace lgraph
