#pragma once

#include <workflow/model.hpp>

#include <nlohmann/json.hpp>

// execution records, found by nlohmann::json through ADL
void to_json(nlohmann::json &j, StepExecution const &step);
void from_json(nlohmann::json const &j, StepExecution &step);

void to_json(nlohmann::json &j, WorkflowExecution const &execution);
void from_json(nlohmann::json const &j, WorkflowExecution &execution);
