#pragma once

#include <util/time.hpp>
#include <util/uuid.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class ProcessingStatus {
    Pending,
    Processing,
    Completed,
    Failed,
    Archived,
};

struct UploadMetadata {
    std::string checksum; // hex sha-256 of the original file
    std::optional<double> compression_ratio;
    std::optional<std::filesystem::path> backup_path;
    std::vector<std::string> tags;
    std::optional<std::string> notes;
};

struct UploadInfo {
    util::uuid_t id{};
    std::string filename;
    std::filesystem::path original_path;
    std::filesystem::path processed_path;
    uint64_t file_size = 0;
    std::string mime_type;
    util::timestamp_t upload_timestamp;
    ProcessingStatus processing_status = ProcessingStatus::Pending;
    UploadMetadata metadata;
};

std::string_view to_string(ProcessingStatus status);
std::optional<ProcessingStatus> processing_status_from_string(std::string_view name);
