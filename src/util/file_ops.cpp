#include <util/file_ops.hpp>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <fmt/format.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <map>
#include <memory>
#include <stdexcept>

namespace util {

std::string extension_of(std::filesystem::path const &path) {
    auto ext = path.extension().string();
    if(not ext.empty() and ext.front() == '.')
        ext.erase(0, 1);

    std::transform(std::begin(ext), std::end(ext), std::begin(ext), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

std::string detect_mime_type(std::filesystem::path const &path) {
    static std::map<std::string, std::string> const types{
        { "txt", "text/plain" },
        { "pdf", "application/pdf" },
        { "doc", "application/msword" },
        { "docx", "application/msword" },
        { "zip", "application/zip" },
        { "tar", "application/x-tar" },
        { "gz", "application/gzip" },
        { "json", "application/json" },
        { "yaml", "application/x-yaml" },
        { "yml", "application/x-yaml" },
    };

    if(auto it = types.find(extension_of(path)); it != std::end(types))
        return it->second;
    return "application/octet-stream";
}

std::string sha256_file(std::filesystem::path const &path) {
    std::ifstream in{ path, std::ios::binary };
    if(not in)
        throw std::runtime_error{ fmt::format("could not open '{}' for hashing", path.string()) };

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
    if(not ctx or EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error{ "could not initialize sha-256 digest" };

    std::array<char, 64 * 1024> buffer{};
    while(in.read(buffer.data(), buffer.size()) or in.gcount() > 0) {
        if(EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(in.gcount())) != 1)
            throw std::runtime_error{ fmt::format("could not hash '{}'", path.string()) };
    }
    if(in.bad())
        throw std::runtime_error{ fmt::format("could not read '{}'", path.string()) };

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1)
        throw std::runtime_error{ fmt::format("could not hash '{}'", path.string()) };

    std::string hex;
    hex.reserve(length * 2);
    for(unsigned int i = 0; i < length; ++i)
        hex += fmt::format("{:02x}", digest[i]);
    return hex;
}

uint64_t gzip_file(std::filesystem::path const &source, std::filesystem::path const &destination) {
    std::ifstream in{ source, std::ios::binary };
    if(not in)
        throw std::runtime_error{ fmt::format("could not open '{}' for compression", source.string()) };

    std::ofstream out{ destination, std::ios::binary | std::ios::trunc };
    if(not out)
        throw std::runtime_error{ fmt::format("could not create '{}'", destination.string()) };

    {
        boost::iostreams::filtering_ostream gz;
        gz.push(boost::iostreams::gzip_compressor{});
        gz.push(out);
        boost::iostreams::copy(in, gz);
    }

    out.close();
    if(not out)
        throw std::runtime_error{ fmt::format("could not write '{}'", destination.string()) };

    return std::filesystem::file_size(destination);
}

} // namespace util
