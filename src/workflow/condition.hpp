#pragma once

#include <workflow/model.hpp>

#include <string>

/**
 * @brief Evaluates a step condition against the run variables
 *
 * A condition without any '$' marker always passes. Otherwise every "$name" is replaced by the
 * value of the variable "name" and the result passes only if it equals "true", ignoring case.
 * There is no boolean logic beyond that.
 */
[[nodiscard]] bool evaluate_condition(std::string const &condition, variables_t const &variables);

// the condition text after variable substitution
[[nodiscard]] std::string substitute_variables(std::string const &condition, variables_t const &variables);
