#pragma once

#include <stdexcept>
#include <string>

namespace lgraph {

/**
 * @brief A record names a vertex that is not in the graph where that is fatal
 */
class ReferenceError : public std::runtime_error {
public:
    explicit ReferenceError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A requested step is missing a parameter or has an invalid one
 *
 * Raised before the graph is touched.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace lgraph
