#include "io/record_reader.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace lgraph {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string location(const std::string& source_name, size_t line_number) {
    return source_name + ":" + std::to_string(line_number);
}

}  // namespace

std::vector<std::string> RecordReader::split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, '\t')) {
        fields.push_back(trim(field));
    }
    return fields;
}

double RecordReader::parse_number(const std::string& field, const std::string& source_name, size_t line_number) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(field, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error(
            "Invalid number '" + field + "' at " + location(source_name, line_number)
        );
    }
    if (consumed != field.size() || !std::isfinite(value)) {
        throw std::runtime_error(
            "Invalid number '" + field + "' at " + location(source_name, line_number)
        );
    }
    return value;
}

std::vector<Edge> RecordReader::read_edges(std::istream& input, const std::string& source_name) {
    std::vector<Edge> edges;
    std::string line;
    size_t line_number = 0;

    while (std::getline(input, line)) {
        line_number++;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') continue;

        auto fields = split_fields(content);
        if (fields.size() != 3 || fields[0].empty() || fields[1].empty()) {
            throw std::runtime_error(
                "Malformed edge line at " + location(source_name, line_number) +
                ": expected source, target, weight"
            );
        }

        Edge edge;
        edge.source = fields[0];
        edge.target = fields[1];
        edge.weight = parse_number(fields[2], source_name, line_number);
        edges.push_back(edge);
    }

    return edges;
}

std::vector<Seed> RecordReader::read_seeds(std::istream& input, const std::string& source_name) {
    std::vector<Seed> seeds;
    std::string line;
    size_t line_number = 0;

    while (std::getline(input, line)) {
        line_number++;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') continue;

        auto fields = split_fields(content);
        if (fields.size() != 3 || fields[0].empty() || fields[1].empty()) {
            throw std::runtime_error(
                "Malformed seed line at " + location(source_name, line_number) +
                ": expected vertex, label, score"
            );
        }

        Seed seed;
        seed.vertex = fields[0];
        seed.label = fields[1];
        seed.score = parse_number(fields[2], source_name, line_number);
        seeds.push_back(seed);
    }

    return seeds;
}

std::vector<Edge> RecordReader::read_edge_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open edge file: " + path);
    }
    return read_edges(file, path);
}

std::vector<Seed> RecordReader::read_seed_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open seed file: " + path);
    }
    return read_seeds(file, path);
}

std::vector<Edge> RecordReader::read_edge_files(const std::vector<std::string>& paths) {
    std::vector<Edge> all;
    for (const auto& path : paths) {
        auto edges = read_edge_file(path);
        all.insert(all.end(), edges.begin(), edges.end());
    }
    return all;
}

std::vector<Seed> RecordReader::read_seed_files(const std::vector<std::string>& paths) {
    std::vector<Seed> all;
    for (const auto& path : paths) {
        auto seeds = read_seed_file(path);
        all.insert(all.end(), seeds.begin(), seeds.end());
    }
    return all;
}

std::vector<std::string> RecordReader::split_file_list(const std::string& list) {
    std::vector<std::string> result;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

} // namespace lgraph
