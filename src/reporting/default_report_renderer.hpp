#pragma once

#include <reporting/events.hpp>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

struct DefaultReportRenderer {
    uint16_t verbose;
    bool console;
    std::shared_ptr<std::FILE> log_file;

    DefaultReportRenderer(uint16_t verbose, bool console = true, std::optional<std::filesystem::path> const &log_path = std::nullopt);

    void operator()(SimpleEvent const &ev) const;
    void operator()(DetailEvent const &ev) const;
    void operator()(WarningEvent const &ev) const;
    void operator()(SuccessEvent const &ev) const;
    void operator()(FailureEvent const &ev) const;
    void operator()(TaskEvent const &ev) const;

    std::string operator()(FailureEvent::Data::Type type) const;
    std::string operator()(FailureEvent::Data const &failure) const;

private:
    void write_log(MetaEvent const &ev, std::string const &tag, std::string const &message) const;
};

/**
 * @brief Maps a textual log level to a renderer verbosity
 *
 * "error" and "warn" map to 0, "info" to 1, "debug" and "trace" to 2.
 * Unknown levels are treated as "info".
 */
uint16_t verbosity_from_level(std::string const &level);
