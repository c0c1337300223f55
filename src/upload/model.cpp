#include <upload/model.hpp>

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<ProcessingStatus, std::string_view>, 5> status_names{ {
    { ProcessingStatus::Pending, "Pending" },
    { ProcessingStatus::Processing, "Processing" },
    { ProcessingStatus::Completed, "Completed" },
    { ProcessingStatus::Failed, "Failed" },
    { ProcessingStatus::Archived, "Archived" },
} };

} // namespace

std::string_view to_string(ProcessingStatus status) {
    for(auto const &[value, name] : status_names)
        if(value == status)
            return name;
    return "Unknown";
}

std::optional<ProcessingStatus> processing_status_from_string(std::string_view name) {
    for(auto const &[value, text] : status_names)
        if(text == name)
            return value;
    return std::nullopt;
}
