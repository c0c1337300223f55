#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace util {

// lower-cased extension without the leading dot; empty if there is none
[[nodiscard]] std::string extension_of(std::filesystem::path const &path);

// MIME type by extension, application/octet-stream for anything unknown
[[nodiscard]] std::string detect_mime_type(std::filesystem::path const &path);

/**
 * @brief Hex encoded SHA-256 digest of the file contents
 *
 * @throws std::runtime_error if the file can not be read
 */
[[nodiscard]] std::string sha256_file(std::filesystem::path const &path);

/**
 * @brief Writes a gzip compressed copy of source to destination
 *
 * @return uint64_t Size of the compressed file in bytes
 * @throws std::runtime_error on any I/O failure
 */
uint64_t gzip_file(std::filesystem::path const &source, std::filesystem::path const &destination);

} // namespace util
