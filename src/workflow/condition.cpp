#include <workflow/condition.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

std::string substitute_variables(std::string const &condition, variables_t const &variables) {
    // longer names first so that "$flag" never eats the prefix of "$flag2"
    std::vector<variables_t::const_iterator> by_length;
    for(auto it = std::begin(variables); it != std::end(variables); ++it)
        by_length.push_back(it);
    std::stable_sort(std::begin(by_length), std::end(by_length), [](auto const &lhs, auto const &rhs) {
        return lhs->first.size() > rhs->first.size();
    });

    auto result = condition;
    for(auto const &var : by_length) {
        auto const placeholder = "$" + var->first;
        auto const &value      = var->second;

        std::string::size_type pos = 0;
        while((pos = result.find(placeholder, pos)) != std::string::npos) {
            result.replace(pos, placeholder.size(), value);
            pos += value.size();
        }
    }
    return result;
}

bool evaluate_condition(std::string const &condition, variables_t const &variables) {
    if(condition.find('$') == std::string::npos)
        return true;

    auto evaluated = substitute_variables(condition, variables);
    std::transform(std::begin(evaluated), std::end(evaluated), std::begin(evaluated),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return evaluated == "true";
}
