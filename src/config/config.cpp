#include <config/config.hpp>
#include <config/yaml_conversion.hpp>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string_view>

namespace {

std::optional<std::string> env_value(char const *name) {
    if(auto const *value = std::getenv(name); value != nullptr and *value != '\0')
        return std::string{ value };
    return std::nullopt;
}

template <typename T>
T env_number(char const *name, std::string const &value) {
    try {
        std::size_t consumed = 0;
        auto const parsed    = std::stoull(value, &consumed);
        if(consumed != value.size())
            throw std::invalid_argument{ value };
        return static_cast<T>(parsed);
    } catch(std::exception const &) {
        throw ConfigException{ fmt::format("environment variable {} is not a number: '{}'", name, value) };
    }
}

} // namespace

Config Config::load(std::filesystem::path const &path) {
    if(not std::filesystem::exists(path))
        throw ConfigException{ fmt::format("configuration file does not exist: {}", path.string()) };

    Config config;
    try {
        config = YAML::LoadFile(path.string()).as<Config>();
    } catch(YAML::Exception const &e) {
        throw ConfigException{ fmt::format("could not load configuration '{}': {}", path.string(), e.what()) };
    }

    config.apply_env_overrides();
    config.validate();
    return config;
}

void Config::apply_env_overrides() {
    if(auto value = env_value("AUTOMATION_WORKFLOW_DIR"))
        workflow.workflow_dir = *value;
    if(auto value = env_value("AUTOMATION_MAX_CONCURRENT_WORKFLOWS"))
        workflow.max_concurrent_workflows = env_number<std::size_t>("AUTOMATION_MAX_CONCURRENT_WORKFLOWS", *value);
    if(auto value = env_value("AUTOMATION_TIMEOUT_SECONDS"))
        workflow.timeout_seconds = env_number<uint64_t>("AUTOMATION_TIMEOUT_SECONDS", *value);
    if(auto value = env_value("AUTOMATION_RETRY_ATTEMPTS"))
        workflow.retry_attempts = env_number<uint32_t>("AUTOMATION_RETRY_ATTEMPTS", *value);
    if(auto value = env_value("AUTOMATION_UPLOAD_DIR"))
        upload.upload_dir = *value;
    if(auto value = env_value("AUTOMATION_BACKUP_DIR"))
        upload.backup_dir = *value;
    if(auto value = env_value("AUTOMATION_LOG_LEVEL"))
        logging.log_level = *value;
    if(auto value = env_value("AUTOMATION_LOG_FILE"))
        logging.log_file = *value;
}

void Config::validate() const {
    if(workflow.max_concurrent_workflows == 0)
        throw ConfigException{ "workflow.max_concurrent_workflows must be positive" };
    if(workflow.timeout_seconds == 0)
        throw ConfigException{ "workflow.timeout_seconds must be positive" };
    if(workflow.timeout_seconds > max_timeout_seconds)
        throw ConfigException{ fmt::format("workflow.timeout_seconds must not exceed {}", max_timeout_seconds) };
    if(not workflow.share_limiter_with_uploads and upload.max_concurrent_uploads == 0)
        throw ConfigException{ "upload.max_concurrent_uploads must be positive" };
}
