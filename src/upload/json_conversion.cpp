#include <upload/json_conversion.hpp>
#include <util/time.hpp>
#include <util/uuid.hpp>

#include <stdexcept>
#include <string>

namespace {

template <typename T>
nlohmann::json or_null(std::optional<T> const &value) {
    if(value)
        return *value;
    return nullptr;
}

template <typename T>
std::optional<T> read_optional(nlohmann::json const &j, char const *key) {
    if(not j.contains(key) or j.at(key).is_null())
        return std::nullopt;
    return j.at(key).get<T>();
}

} // namespace

void to_json(nlohmann::json &j, UploadMetadata const &metadata) {
    nlohmann::json backup = nullptr;
    if(metadata.backup_path)
        backup = metadata.backup_path->string();

    j = nlohmann::json{
        { "checksum", metadata.checksum },
        { "compression_ratio", or_null(metadata.compression_ratio) },
        { "backup_path", backup },
        { "tags", metadata.tags },
        { "notes", or_null(metadata.notes) },
    };
}

void from_json(nlohmann::json const &j, UploadMetadata &metadata) {
    metadata.checksum          = j.at("checksum").get<std::string>();
    metadata.compression_ratio = read_optional<double>(j, "compression_ratio");
    metadata.tags              = j.value("tags", std::vector<std::string>{});
    metadata.notes             = read_optional<std::string>(j, "notes");

    if(auto backup = read_optional<std::string>(j, "backup_path"))
        metadata.backup_path = *backup;
    else
        metadata.backup_path = std::nullopt;
}

void to_json(nlohmann::json &j, UploadInfo const &info) {
    j = nlohmann::json{
        { "id", util::to_string(info.id) },
        { "filename", info.filename },
        { "original_path", info.original_path.string() },
        { "processed_path", info.processed_path.string() },
        { "file_size", info.file_size },
        { "mime_type", info.mime_type },
        { "upload_timestamp", util::format_timestamp(info.upload_timestamp) },
        { "processing_status", std::string{ to_string(info.processing_status) } },
        { "metadata", info.metadata },
    };
}

void from_json(nlohmann::json const &j, UploadInfo &info) {
    info.id               = util::parse_uuid(j.at("id").get<std::string>());
    info.filename         = j.at("filename").get<std::string>();
    info.original_path    = j.at("original_path").get<std::string>();
    info.processed_path   = j.at("processed_path").get<std::string>();
    info.file_size        = j.at("file_size").get<uint64_t>();
    info.mime_type        = j.at("mime_type").get<std::string>();
    info.upload_timestamp = util::parse_timestamp(j.at("upload_timestamp").get<std::string>());
    info.metadata         = j.at("metadata").get<UploadMetadata>();

    auto const name   = j.at("processing_status").get<std::string>();
    auto const status = processing_status_from_string(name);
    if(not status)
        throw std::invalid_argument{ "unknown processing status '" + name + "'" };
    info.processing_status = *status;
}
