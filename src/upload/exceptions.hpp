#pragma once

#include <fmt/format.h>

#include <filesystem>
#include <stdexcept>
#include <string>

struct UploadException : public std::runtime_error {
    UploadException(std::filesystem::path const &path, std::string const &reason)
        : std::runtime_error{ fmt::format("Upload of '{}' failed: {}", path.string(), reason) }
        , path{ path.string() }
        , reason{ reason } { }
    std::string path;
    std::string reason;
};
