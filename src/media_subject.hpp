#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

// The media item a job operates on. `record` is the catalog's own document,
// carried opaquely so updates can be written back field-for-field.
struct MediaSubject {
  std::int64_t id = 0;
  std::string title;
  std::filesystem::path location;   // current media file (or its folder)
  std::filesystem::path folder;     // catalog folder, may be empty
  nlohmann::json record = nlohmann::json::object();
};

// Accepts our own form ({id, title, location[, folder, record]}) or a raw
// catalog movie document ({id, title, path, movieFile: {path}}). Throws
// PreconditionError when the identifier, title or location is missing.
MediaSubject subject_from_json(const nlohmann::json& doc);
nlohmann::json subject_to_json(const MediaSubject& subject);
