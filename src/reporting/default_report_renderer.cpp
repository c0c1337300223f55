#include <reporting/default_report_renderer.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

DefaultReportRenderer::DefaultReportRenderer(uint16_t verbose, bool console, std::optional<std::filesystem::path> const &log_path)
    : verbose{ verbose }
    , console{ console } {
    if(log_path) {
        if(log_path->has_parent_path())
            std::filesystem::create_directories(log_path->parent_path());

        auto *file = std::fopen(log_path->c_str(), "a");
        if(file == nullptr)
            throw std::runtime_error(fmt::format("could not open log file '{}'", log_path->string()));
        log_file = std::shared_ptr<std::FILE>(file, &std::fclose);
    }
}

void DefaultReportRenderer::operator()(SimpleEvent const &ev) const {
    if(verbose < 1)
        return;
    write_log(ev, ev.label, ev.message);
    if(not console)
        return;
    fmt::print(fg(fmt::color::ghost_white), "? | ");
    fmt::print(fg(fmt::color::pale_green) | fmt::emphasis::bold, "{} ", ev.label);
    fmt::print(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}\n", ev.message);
}

void DefaultReportRenderer::operator()(DetailEvent const &ev) const {
    if(verbose < 2)
        return;
    write_log(ev, ev.label, ev.message);
    if(not console)
        return;
    fmt::print(fg(fmt::color::ghost_white), "  | ");
    fmt::print(fg(fmt::color::light_slate_gray) | fmt::emphasis::bold, "{} ", ev.label);
    fmt::print(fg(fmt::color::light_slate_gray), "{}\n", ev.message);
}

void DefaultReportRenderer::operator()(WarningEvent const &ev) const {
    write_log(ev, "WARN " + ev.label, ev.message);
    if(not console)
        return;
    fmt::print(fg(fmt::color::ghost_white), "! | ");
    fmt::print(fg(fmt::color::gold) | fmt::emphasis::bold, "{} ", ev.label);
    fmt::print(fg(fmt::color::khaki), "{}\n", ev.message);
}

void DefaultReportRenderer::operator()(SuccessEvent const &ev) const {
    if(verbose < 1)
        return;
    write_log(ev, "SUCCESS", ev.subject);
    if(not console)
        return;
    fmt::print(fg(fmt::color::ghost_white), "+ | ");
    fmt::print(fg(fmt::color::pale_green) | fmt::emphasis::bold, "SUCCESS ");
    fmt::print(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}\n", ev.subject);
}

std::string DefaultReportRenderer::operator()(FailureEvent::Data::Type type) const {
    switch(type) {
    case FailureEvent::Data::Type::DEFINITION:
        return fmt::format(fg(fmt::color::orange_red) | fmt::emphasis::bold, "DEFINITION");
    case FailureEvent::Data::Type::GRAPH:
        return fmt::format(fg(fmt::color::orange_red) | fmt::emphasis::bold, "GRAPH");
    case FailureEvent::Data::Type::STEP:
        return fmt::format(fg(fmt::color::indian_red) | fmt::emphasis::bold, "STEP");
    case FailureEvent::Data::Type::TASK:
        return fmt::format(fg(fmt::color::indian_red) | fmt::emphasis::bold, "TASK");
    case FailureEvent::Data::Type::UPLOAD:
        return fmt::format(fg(fmt::color::indian_red) | fmt::emphasis::bold, "UPLOAD");
    }
    return "";
}

std::string DefaultReportRenderer::operator()(FailureEvent::Data const &failure) const {
    auto path   = fmt::format(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}", failure.path);
    auto detail = [&failure]() -> std::string {
        if(not failure.detail.empty())
            return fmt::format("\n\nExtra detail:\n---\n{}\n---\n", failure.detail);
        return "";
    }();
    return fmt::format("  {} {} [{}]: {}{}",
        fmt::format(fg(fmt::color::red) | fmt::emphasis::bold, "-"),
        this->operator()(failure.type), path, failure.message, detail);
}

// failures are always shown, regardless of verbosity
void DefaultReportRenderer::operator()(FailureEvent const &ev) const {
    if(log_file) {
        for(auto const &issue : ev.issues)
            write_log(ev, "FAIL " + ev.subject, fmt::format("[{}] {}", issue.path, issue.message));
    }
    if(not console)
        return;

    std::vector<std::string> issues;
    std::transform(std::begin(ev.issues), std::end(ev.issues),
        std::back_inserter(issues),
        [this](FailureEvent::Data const &issue) -> std::string {
            return this->operator()(issue);
        });

    auto flat_issues = fmt::format("{}", fmt::join(issues, "\n"));
    auto all_issues  = fmt::format(fg(fmt::color::dark_red) | fmt::emphasis::bold, "{}", flat_issues);

    fmt::print(fg(fmt::color::ghost_white), "- | ");
    fmt::print(fg(fmt::color::red) | fmt::emphasis::bold, "FAIL ");
    fmt::print("'{}':\n{}\n",
        fmt::format(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}", ev.subject),
        all_issues);
}

void DefaultReportRenderer::operator()(TaskEvent const &ev) const {
    if(verbose < 1)
        return;
    write_log(ev, "TASK " + ev.status, fmt::format("{} {} {}", ev.kind, ev.task_id, ev.subject));
    if(not console)
        return;
    fmt::print(fg(fmt::color::ghost_white), "# | ");
    fmt::print(fg(fmt::color::medium_purple) | fmt::emphasis::bold, "TASK {} ", ev.status);
    fmt::print(fg(fmt::color::sky_blue), "{} {} ", ev.kind, ev.task_id);
    fmt::print(fg(fmt::color::ghost_white), "{}\n", ev.subject);
}

void DefaultReportRenderer::write_log(MetaEvent const &ev, std::string const &tag, std::string const &message) const {
    if(not log_file)
        return;

    auto const secs = std::chrono::floor<std::chrono::seconds>(ev.time);
    auto const tm   = fmt::gmtime(std::chrono::system_clock::to_time_t(secs));
    fmt::print(log_file.get(), "[{:%Y-%m-%d %H:%M:%S}] {} {}\n", tm, tag, message);
    std::fflush(log_file.get());
}

uint16_t verbosity_from_level(std::string const &level) {
    auto lowered = level;
    std::transform(std::begin(lowered), std::end(lowered), std::begin(lowered),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if(lowered == "error" or lowered == "warn" or lowered == "warning")
        return 0;
    if(lowered == "debug" or lowered == "trace")
        return 2;
    return 1;
}
