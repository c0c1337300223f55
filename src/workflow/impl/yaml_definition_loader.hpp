#pragma once

#include <workflow/model.hpp>

#include <filesystem>
#include <vector>

namespace impl {

/**
 * @brief Loads workflow definitions from JSON or YAML files
 *
 * JSON is read through the YAML parser, so both notations share one set of conversions.
 */
class YamlDefinitionLoader {
public:
    // throws WorkflowDefinitionException
    Workflow load(std::filesystem::path const &path) const;

    // definition files directly inside dir, sorted by name
    std::vector<std::filesystem::path> discover(std::filesystem::path const &dir) const;
};

} // namespace impl
