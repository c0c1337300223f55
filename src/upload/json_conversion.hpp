#pragma once

#include <upload/model.hpp>

#include <nlohmann/json.hpp>

void to_json(nlohmann::json &j, UploadMetadata const &metadata);
void from_json(nlohmann::json const &j, UploadMetadata &metadata);

void to_json(nlohmann::json &j, UploadInfo const &info);
void from_json(nlohmann::json const &j, UploadInfo &info);
