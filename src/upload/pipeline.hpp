#pragma once

#include <config/config.hpp>
#include <reporting/events.hpp>
#include <upload/exceptions.hpp>
#include <upload/impl/upload_store.hpp>
#include <upload/model.hpp>
#include <util/file_ops.hpp>
#include <util/time.hpp>
#include <util/uuid.hpp>

#include <di.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

inline constexpr uint64_t large_file_threshold = 10 * 1024 * 1024;
inline constexpr auto archive_age              = std::chrono::hours{ 24 * 30 };

[[nodiscard]] inline bool is_archivable(util::timestamp_t uploaded_at, util::timestamp_t now) {
    return uploaded_at < now - archive_age;
}

/**
 * @brief Takes a file through the upload procedure
 *
 * validate -> describe -> backup -> copy -> compress -> tag -> archive -> record.
 * Any failure along the way surfaces as UploadException.
 */
template <typename ReportEngineType>
class UploadPipeline {
    using reporting_t = ReportEngineType;

public:
    using services_t = di::Deps<reporting_t>;

private:
    services_t services_;
    UploadConfig config_;
    impl::UploadStore store_;

public:
    UploadPipeline(services_t services, UploadConfig const &config)
        : services_{ services }
        , config_{ config }
        , store_{ config.upload_dir } { }

    // throws UploadException
    UploadInfo process_upload(std::filesystem::path const &path) {
        try {
            validate(path);

            auto info = describe(path);
            report(SimpleEvent{ "UPLOAD", fmt::format("{} as {}", path.string(), util::to_string(info.id)) });

            run_procedure(info);
            report(DetailEvent{ "RECORD", store_.save(info).string() });

            report(SuccessEvent{ fmt::format("{} ({})", info.filename, to_string(info.processing_status)) });
            return info;
        } catch(UploadException const &e) {
            report_failure(e);
            throw;
        } catch(std::exception const &e) {
            UploadException error{ path, e.what() };
            report_failure(error);
            throw error;
        }
    }

    // every readable upload record, oldest first
    std::vector<UploadInfo> list_uploads() {
        std::vector<UploadInfo> uploads;
        for(auto const &record : store_.records()) {
            try {
                uploads.push_back(store_.read(record));
            } catch(std::runtime_error const &e) {
                report(WarningEvent{ "SKIPPED RECORD", e.what() });
            }
        }

        std::sort(std::begin(uploads), std::end(uploads), [](auto const &a, auto const &b) {
            return a.upload_timestamp < b.upload_timestamp;
        });
        return uploads;
    }

    std::optional<UploadInfo> get_upload(util::uuid_t const &upload_id) const {
        return store_.load(upload_id);
    }

    /**
     * @brief Removes the processed file, its backup and the record of an upload
     *
     * @return false if there is no such upload
     */
    bool delete_upload(util::uuid_t const &upload_id) {
        auto const info = store_.load(upload_id);
        if(not info)
            return false;

        std::filesystem::remove(info->processed_path);
        if(info->metadata.backup_path)
            std::filesystem::remove(*info->metadata.backup_path);
        store_.remove(upload_id);

        report(SimpleEvent{ "DELETED", util::to_string(upload_id) });
        return true;
    }

private:
    void validate(std::filesystem::path const &path) const {
        if(not std::filesystem::exists(path))
            throw UploadException{ path, "Upload path does not exist" };
        if(not std::filesystem::is_regular_file(path))
            throw UploadException{ path, "Upload path is not a regular file" };

        auto const size = std::filesystem::file_size(path);
        if(size > config_.max_file_size)
            throw UploadException{ path, fmt::format("File size {} exceeds maximum allowed size {}", size, config_.max_file_size) };

        if(auto const ext = util::extension_of(path); not ext.empty()) {
            auto const &allowed = config_.allowed_extensions;
            if(std::find(std::begin(allowed), std::end(allowed), ext) == std::end(allowed))
                throw UploadException{ path, fmt::format("File extension '{}' is not allowed", ext) };
        }

        if(std::ifstream probe{ path, std::ios::binary }; not probe)
            throw UploadException{ path, "File is not readable" };
    }

    UploadInfo describe(std::filesystem::path const &path) const {
        UploadInfo info;
        info.id                = util::make_uuid();
        info.filename          = path.filename().string();
        info.original_path     = path;
        info.processed_path    = config_.upload_dir / info.filename;
        info.file_size         = std::filesystem::file_size(path);
        info.mime_type         = util::detect_mime_type(path);
        info.upload_timestamp  = std::chrono::system_clock::now();
        info.processing_status = ProcessingStatus::Pending;
        info.metadata.checksum = util::sha256_file(path);
        return info;
    }

    void run_procedure(UploadInfo &info) {
        info.processing_status = ProcessingStatus::Processing;

        if(config_.backup_enabled)
            backup(info);

        std::filesystem::create_directories(config_.upload_dir);
        std::filesystem::copy_file(info.original_path, info.processed_path, std::filesystem::copy_options::overwrite_existing);
        report(DetailEvent{ "COPIED", info.processed_path.string() });

        if(config_.compression_enabled)
            compress(info);

        tag(info);

        if(is_archivable(info.upload_timestamp, std::chrono::system_clock::now())) {
            archive(info);
            return;
        }
        info.processing_status = ProcessingStatus::Completed;
    }

    void backup(UploadInfo &info) {
        auto const name = fmt::format("{}_{}.bak", util::to_string(info.id), util::format_utc(info.upload_timestamp, "%Y%m%d_%H%M%S"));
        auto const path = config_.backup_dir / name;

        std::filesystem::create_directories(config_.backup_dir);
        std::filesystem::copy_file(info.original_path, path, std::filesystem::copy_options::overwrite_existing);
        info.metadata.backup_path = path;

        report(DetailEvent{ "BACKUP", path.string() });
    }

    // the uncompressed copy is replaced by <filename>.gz
    void compress(UploadInfo &info) {
        auto compressed = info.processed_path;
        compressed += ".gz";

        auto const compressed_size = util::gzip_file(info.processed_path, compressed);
        std::filesystem::remove(info.processed_path);

        info.processed_path             = compressed;
        info.metadata.compression_ratio = static_cast<double>(info.file_size) / static_cast<double>(std::max<uint64_t>(compressed_size, 1));

        report(DetailEvent{ "COMPRESSED", fmt::format("{} ratio {:.2f}", compressed.string(), *info.metadata.compression_ratio) });
    }

    void tag(UploadInfo &info) const {
        if(auto const ext = util::extension_of(info.processed_path); not ext.empty())
            info.metadata.tags.push_back(fmt::format("ext:{}", ext));
        if(info.file_size > large_file_threshold)
            info.metadata.tags.push_back("large_file");
        info.metadata.tags.push_back(fmt::format("uploaded:{}", util::format_utc(info.upload_timestamp, "%Y-%m-%d")));
    }

    void archive(UploadInfo &info) {
        auto const dir = config_.upload_dir / "archive";
        std::filesystem::create_directories(dir);

        auto const path = dir / info.processed_path.filename();
        std::filesystem::rename(info.processed_path, path);
        info.processed_path    = path;
        info.processing_status = ProcessingStatus::Archived;

        report(DetailEvent{ "ARCHIVED", path.string() });
    }

    void report_failure(UploadException const &e) {
        report(FailureEvent{ e.path, { { FailureEvent::Data::Type::UPLOAD, e.path, e.reason } } });
    }

    void report(auto &&ev) {
        auto const &reporting = services_.template get<reporting_t>();
        reporting.get().record(std::move(ev));
    }
};
