#pragma once

#include <util/uuid.hpp>
#include <workflow/model.hpp>

#include <filesystem>
#include <optional>

namespace impl {

/**
 * @brief Flat-file store of execution records
 *
 * One pretty-printed JSON file per run at <workflow_dir>/executions/<execution_id>.json,
 * written once and never updated.
 */
class ExecutionStore {
    std::filesystem::path dir_;

public:
    explicit ExecutionStore(std::filesystem::path const &workflow_dir);

    // returns the path of the written record
    std::filesystem::path save(WorkflowExecution const &execution) const;

    // std::nullopt if no record exists; throws std::runtime_error on a malformed record
    std::optional<WorkflowExecution> load(util::uuid_t const &execution_id) const;

    std::filesystem::path record_path(util::uuid_t const &execution_id) const;
};

} // namespace impl
