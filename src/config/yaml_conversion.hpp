#pragma once

#include <config/config.hpp>

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <string>
#include <vector>

namespace YAML {

template <>
struct convert<std::filesystem::path> {
    static bool decode(const Node &node, std::filesystem::path &rhs) {
        if(not node.IsScalar())
            return false;
        rhs = node.as<std::string>();
        return true;
    }
};

template <>
struct convert<UploadConfig> {
    static bool decode(const Node &node, UploadConfig &rhs) {
        if(not node.IsMap())
            return false;

        if(node["upload_dir"])
            rhs.upload_dir = node["upload_dir"].as<std::filesystem::path>();
        if(node["max_file_size"])
            rhs.max_file_size = node["max_file_size"].as<uint64_t>();
        if(node["allowed_extensions"])
            rhs.allowed_extensions = node["allowed_extensions"].as<std::vector<std::string>>();
        if(node["compression_enabled"])
            rhs.compression_enabled = node["compression_enabled"].as<bool>();
        if(node["backup_enabled"])
            rhs.backup_enabled = node["backup_enabled"].as<bool>();
        if(node["backup_dir"])
            rhs.backup_dir = node["backup_dir"].as<std::filesystem::path>();
        if(node["max_concurrent_uploads"])
            rhs.max_concurrent_uploads = node["max_concurrent_uploads"].as<std::size_t>();
        return true;
    }
};

template <>
struct convert<WorkflowConfig> {
    static bool decode(const Node &node, WorkflowConfig &rhs) {
        if(not node.IsMap())
            return false;

        if(node["workflow_dir"])
            rhs.workflow_dir = node["workflow_dir"].as<std::filesystem::path>();
        if(node["max_concurrent_workflows"])
            rhs.max_concurrent_workflows = node["max_concurrent_workflows"].as<std::size_t>();
        if(node["timeout_seconds"])
            rhs.timeout_seconds = node["timeout_seconds"].as<uint64_t>();
        if(node["retry_attempts"])
            rhs.retry_attempts = node["retry_attempts"].as<uint32_t>();
        if(node["retry_backoff_cap_seconds"])
            rhs.retry_backoff_cap_seconds = node["retry_backoff_cap_seconds"].as<uint64_t>();
        if(node["share_limiter_with_uploads"])
            rhs.share_limiter_with_uploads = node["share_limiter_with_uploads"].as<bool>();
        return true;
    }
};

template <>
struct convert<LoggingConfig> {
    static bool decode(const Node &node, LoggingConfig &rhs) {
        if(not node.IsMap())
            return false;

        if(node["log_level"])
            rhs.log_level = node["log_level"].as<std::string>();
        if(node["log_file"] and not node["log_file"].IsNull())
            rhs.log_file = node["log_file"].as<std::filesystem::path>();
        if(node["enable_console"])
            rhs.enable_console = node["enable_console"].as<bool>();
        return true;
    }
};

template <>
struct convert<Config> {
    static bool decode(const Node &node, Config &rhs) {
        if(node.IsNull())
            return true; // empty file, all defaults
        if(not node.IsMap())
            return false;

        if(node["upload"])
            rhs.upload = node["upload"].as<UploadConfig>();
        if(node["workflow"])
            rhs.workflow = node["workflow"].as<WorkflowConfig>();
        if(node["logging"])
            rhs.logging = node["logging"].as<LoggingConfig>();
        return true;
    }
};

} // namespace YAML
