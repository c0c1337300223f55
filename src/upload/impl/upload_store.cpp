#include <upload/impl/upload_store.hpp>
#include <upload/json_conversion.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace impl {

namespace {

UploadInfo read_record(std::filesystem::path const &path) {
    std::ifstream in{ path };
    if(not in)
        throw std::runtime_error{ fmt::format("could not read upload record '{}'", path.string()) };

    try {
        return nlohmann::json::parse(in).get<UploadInfo>();
    } catch(std::exception const &e) {
        throw std::runtime_error{ fmt::format("malformed upload record '{}': {}", path.string(), e.what()) };
    }
}

} // namespace

UploadStore::UploadStore(std::filesystem::path const &upload_dir)
    : dir_{ upload_dir / "records" } { }

std::filesystem::path UploadStore::save(UploadInfo const &info) const {
    std::filesystem::create_directories(dir_);

    auto const path = record_path(info.id);
    std::ofstream out{ path, std::ios::trunc };
    out << nlohmann::json(info).dump(4) << '\n';
    if(not out)
        throw std::runtime_error{ fmt::format("could not write upload record '{}'", path.string()) };

    return path;
}

std::optional<UploadInfo> UploadStore::load(util::uuid_t const &upload_id) const {
    auto const path = record_path(upload_id);
    if(not std::filesystem::exists(path))
        return std::nullopt;
    return read_record(path);
}

std::vector<std::filesystem::path> UploadStore::records() const {
    std::vector<std::filesystem::path> paths;
    if(not std::filesystem::is_directory(dir_))
        return paths;

    for(auto const &entry : std::filesystem::directory_iterator{ dir_ }) {
        if(entry.is_regular_file() and entry.path().extension() == ".json")
            paths.push_back(entry.path());
    }

    std::sort(std::begin(paths), std::end(paths));
    return paths;
}

UploadInfo UploadStore::read(std::filesystem::path const &path) const {
    return read_record(path);
}

bool UploadStore::remove(util::uuid_t const &upload_id) const {
    return std::filesystem::remove(record_path(upload_id));
}

std::filesystem::path UploadStore::record_path(util::uuid_t const &upload_id) const {
    return dir_ / fmt::format("{}.json", util::to_string(upload_id));
}

} // namespace impl
