#include <workflow/impl/execution_store.hpp>
#include <workflow/json_conversion.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace impl {

ExecutionStore::ExecutionStore(std::filesystem::path const &workflow_dir)
    : dir_{ workflow_dir / "executions" } { }

std::filesystem::path ExecutionStore::save(WorkflowExecution const &execution) const {
    std::filesystem::create_directories(dir_);

    auto const path = record_path(execution.id);
    std::ofstream out{ path, std::ios::trunc };
    if(not out)
        throw std::runtime_error{ fmt::format("could not write execution record '{}'", path.string()) };

    out << nlohmann::json(execution).dump(4) << '\n';
    if(not out)
        throw std::runtime_error{ fmt::format("could not write execution record '{}'", path.string()) };

    return path;
}

std::optional<WorkflowExecution> ExecutionStore::load(util::uuid_t const &execution_id) const {
    auto const path = record_path(execution_id);
    if(not std::filesystem::exists(path))
        return std::nullopt;

    std::ifstream in{ path };
    if(not in)
        throw std::runtime_error{ fmt::format("could not read execution record '{}'", path.string()) };

    try {
        return nlohmann::json::parse(in).get<WorkflowExecution>();
    } catch(std::exception const &e) {
        throw std::runtime_error{ fmt::format("malformed execution record '{}': {}", path.string(), e.what()) };
    }
}

std::filesystem::path ExecutionStore::record_path(util::uuid_t const &execution_id) const {
    return dir_ / fmt::format("{}.json", util::to_string(execution_id));
}

} // namespace impl
