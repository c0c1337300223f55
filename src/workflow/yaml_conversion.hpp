#pragma once

#include <config/config.hpp>
#include <util/time.hpp>
#include <util/uuid.hpp>
#include <workflow/model.hpp>

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace detail {

inline bool present(YAML::Node const &node, std::string const &key) {
    return node[key] and not node[key].IsNull();
}

inline YAML::Node required(YAML::Node const &node, std::string const &key, std::string const &owner) {
    if(not present(node, key))
        throw std::invalid_argument{ owner + ": missing required field '" + key + "'" };
    return node[key];
}

} // namespace detail

namespace YAML {

template <>
struct convert<StepType> {
    static bool decode(const Node &node, StepType &rhs) {
        if(not node.IsScalar())
            return false;
        auto type = step_type_from_string(node.as<std::string>());
        if(not type)
            throw std::invalid_argument{ "unknown step_type '" + node.as<std::string>() + "'" };
        rhs = *type;
        return true;
    }
};

template <>
struct convert<WorkflowPriority> {
    static bool decode(const Node &node, WorkflowPriority &rhs) {
        if(not node.IsScalar())
            return false;
        auto priority = priority_from_string(node.as<std::string>());
        if(not priority)
            throw std::invalid_argument{ "unknown priority '" + node.as<std::string>() + "'" };
        rhs = *priority;
        return true;
    }
};

template <>
struct convert<ResourceRequirements> {
    static bool decode(const Node &node, ResourceRequirements &rhs) {
        if(not node.IsMap())
            return false;

        if(::detail::present(node, "cpu_cores"))
            rhs.cpu_cores = node["cpu_cores"].as<uint32_t>();
        if(::detail::present(node, "memory_mb"))
            rhs.memory_mb = node["memory_mb"].as<uint32_t>();
        if(::detail::present(node, "disk_space_mb"))
            rhs.disk_space_mb = node["disk_space_mb"].as<uint32_t>();
        return true;
    }
};

template <>
struct convert<WorkflowMetadata> {
    static bool decode(const Node &node, WorkflowMetadata &rhs) {
        if(not node.IsMap())
            return false;

        if(::detail::present(node, "author"))
            rhs.author = node["author"].as<std::string>();
        if(::detail::present(node, "tags"))
            rhs.tags = node["tags"].as<std::vector<std::string>>();
        if(::detail::present(node, "priority"))
            rhs.priority = node["priority"].as<WorkflowPriority>();
        if(::detail::present(node, "estimated_duration"))
            rhs.estimated_duration = node["estimated_duration"].as<uint64_t>();
        if(::detail::present(node, "resource_requirements"))
            rhs.resource_requirements = node["resource_requirements"].as<ResourceRequirements>();
        return true;
    }
};

template <>
struct convert<WorkflowStep> {
    static bool decode(const Node &node, WorkflowStep &rhs) {
        if(not node.IsMap())
            return false;

        rhs.id        = ::detail::required(node, "id", "step").as<std::string>();
        auto owner    = "step '" + rhs.id + "'";
        rhs.name      = ::detail::required(node, "name", owner).as<std::string>();
        rhs.step_type = ::detail::required(node, "step_type", owner).as<StepType>();
        rhs.command   = ::detail::required(node, "command", owner).as<std::string>();

        if(::detail::present(node, "args"))
            rhs.args = node["args"].as<std::vector<std::string>>();
        if(::detail::present(node, "timeout")) {
            rhs.timeout = node["timeout"].as<uint64_t>();
            if(*rhs.timeout == 0)
                throw std::invalid_argument{ owner + ": timeout must be positive" };
            if(*rhs.timeout > max_timeout_seconds)
                throw std::invalid_argument{ owner + ": timeout must not exceed " + std::to_string(max_timeout_seconds) + " seconds" };
        }
        if(::detail::present(node, "retry_count"))
            rhs.retry_count = node["retry_count"].as<uint32_t>();
        if(::detail::present(node, "depends_on"))
            rhs.depends_on = node["depends_on"].as<std::vector<std::string>>();
        if(::detail::present(node, "condition"))
            rhs.condition = node["condition"].as<std::string>();
        if(::detail::present(node, "output"))
            rhs.output = node["output"].as<std::string>();
        return true;
    }
};

template <>
struct convert<Workflow> {
    static bool decode(const Node &node, Workflow &rhs) {
        if(not node.IsMap())
            return false;

        auto const id_text = ::detail::required(node, "id", "workflow").as<std::string>();
        try {
            rhs.id = util::parse_uuid(id_text);
        } catch(std::runtime_error const &) {
            throw std::invalid_argument{ "workflow id is not a valid UUID: '" + id_text + "'" };
        }

        rhs.name       = ::detail::required(node, "name", "workflow").as<std::string>();
        rhs.version    = ::detail::required(node, "version", "workflow").as<std::string>();
        rhs.created_at = util::parse_timestamp(::detail::required(node, "created_at", "workflow").as<std::string>());
        rhs.steps      = ::detail::required(node, "steps", "workflow").as<std::vector<WorkflowStep>>();

        if(::detail::present(node, "description"))
            rhs.description = node["description"].as<std::string>();
        if(::detail::present(node, "variables"))
            rhs.variables = node["variables"].as<variables_t>();
        if(::detail::present(node, "metadata"))
            rhs.metadata = node["metadata"].as<WorkflowMetadata>();
        return true;
    }
};

} // namespace YAML
