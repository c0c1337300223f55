#pragma once

#include <upload/model.hpp>
#include <util/uuid.hpp>

#include <filesystem>
#include <optional>
#include <vector>

namespace impl {

// one JSON record per upload at <upload_dir>/records/<upload_id>.json
class UploadStore {
    std::filesystem::path dir_;

public:
    explicit UploadStore(std::filesystem::path const &upload_dir);

    std::filesystem::path save(UploadInfo const &info) const;

    // std::nullopt if no record exists; throws std::runtime_error on a malformed record
    std::optional<UploadInfo> load(util::uuid_t const &upload_id) const;

    // paths of all stored records, sorted
    std::vector<std::filesystem::path> records() const;

    // throws std::runtime_error on an unreadable or malformed record
    UploadInfo read(std::filesystem::path const &path) const;

    bool remove(util::uuid_t const &upload_id) const;

    std::filesystem::path record_path(util::uuid_t const &upload_id) const;
};

} // namespace impl
