#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct ConfigException : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct UploadConfig {
    std::filesystem::path upload_dir = "./uploads";
    uint64_t max_file_size           = 100 * 1024 * 1024;
    std::vector<std::string> allowed_extensions{ "txt", "pdf", "doc", "docx", "zip", "tar", "gz" };
    bool compression_enabled          = true;
    bool backup_enabled               = true;
    std::filesystem::path backup_dir  = "./backups";
    std::size_t max_concurrent_uploads = 4; // only used when uploads do not share the workflow limiter
};

// longest timeout a deadline can be built from without overflowing the clock
inline constexpr uint64_t max_timeout_seconds = 10ull * 365 * 24 * 60 * 60;

struct WorkflowConfig {
    std::filesystem::path workflow_dir  = "./workflows";
    std::size_t max_concurrent_workflows = 4;
    uint64_t timeout_seconds             = 3600;
    uint32_t retry_attempts              = 3;
    uint64_t retry_backoff_cap_seconds   = 0; // 0 keeps the uncapped 2^attempt formula
    bool share_limiter_with_uploads      = true;
};

struct LoggingConfig {
    std::string log_level = "info";
    std::optional<std::filesystem::path> log_file;
    bool enable_console = true;
};

struct Config {
    UploadConfig upload;
    WorkflowConfig workflow;
    LoggingConfig logging;

    /**
     * @brief Loads the YAML configuration file and applies AUTOMATION_* environment overrides
     *
     * Keys missing from the file keep their default values.
     *
     * @throws ConfigException if the file is missing, malformed or holds invalid values
     */
    static Config load(std::filesystem::path const &path);

    void apply_env_overrides();

    // throws ConfigException
    void validate() const;
};
