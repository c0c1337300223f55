#pragma once

#include <reporting/default_report_renderer.hpp>
#include <reporting/report_engine.hpp>
#include <util/uuid.hpp>
#include <workflow/model.hpp>

#include <di.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

using rep_renderer_t = DefaultReportRenderer;
using reporting_t    = ReportEngine<rep_renderer_t>;

// renders every event but prints nothing
struct QuietReporting {
    rep_renderer_t renderer{ 0, false };
    reporting_t engine{ di::Deps<rep_renderer_t>{ renderer }, true };
};

class TempDir {
    std::filesystem::path path_;

public:
    TempDir()
        : path_{ std::filesystem::temp_directory_path() / ("opsrunner-" + util::to_string(util::make_uuid())) } {
        std::filesystem::create_directories(path_);
    }

    TempDir(TempDir const &)            = delete;
    TempDir &operator=(TempDir const &) = delete;

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::filesystem::path const &path() const {
        return path_;
    }

    std::filesystem::path operator/(std::string const &name) const {
        return path_ / name;
    }
};

inline void write_file(std::filesystem::path const &path, std::string const &content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    out << content;
}

inline std::string read_file(std::filesystem::path const &path) {
    std::ifstream in{ path, std::ios::binary };
    return { std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
}

/**
 * @brief Command runner driven by a callback instead of real processes
 *
 * The callback gets the command and the 1-based number of the invocation for that command.
 */
struct MockRunner {
    using behaviour_t = std::function<std::string(std::string const &, std::size_t)>;

    behaviour_t behaviour = [](std::string const &, std::size_t) { return std::string{}; };

    mutable std::mutex mtx;
    mutable std::vector<std::string> calls;
    mutable std::vector<variables_t> environments;

    std::string run(std::string const &command, std::vector<std::string> const &, variables_t const &variables, std::chrono::seconds) const {
        std::size_t attempt = 0;
        {
            std::scoped_lock l{ mtx };
            calls.push_back(command);
            environments.push_back(variables);
            for(auto const &call : calls)
                if(call == command)
                    ++attempt;
        }
        return behaviour(command, attempt);
    }

    std::size_t count(std::string const &command) const {
        std::scoped_lock l{ mtx };
        std::size_t n = 0;
        for(auto const &call : calls)
            if(call == command)
                ++n;
        return n;
    }
};

struct RecordingSleeper {
    mutable std::vector<std::chrono::seconds> delays;

    void sleep_for(std::chrono::seconds delay) const {
        delays.push_back(delay);
    }
};

inline WorkflowStep make_step(std::string const &id, std::vector<std::string> const &depends_on = {}) {
    WorkflowStep step;
    step.id         = id;
    step.name       = "step " + id;
    step.command    = id;
    step.depends_on = depends_on;
    return step;
}
