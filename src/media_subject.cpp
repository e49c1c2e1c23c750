#include "media_subject.hpp"

#include <cerrno>
#include <cstdlib>

#include "errors.hpp"

namespace {

std::int64_t read_id(const nlohmann::json& doc) {
  if(!doc.contains("id")) {
    throw PreconditionError("Subject has no identifier");
  }
  const auto& id = doc.at("id");
  if(id.is_number_integer()) return id.get<std::int64_t>();
  if(id.is_string()) {
    const auto text = id.get<std::string>();
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if(!text.empty() && errno == 0 && end && *end == '\0') return value;
  }
  throw PreconditionError("Subject identifier must be numeric (got " + id.dump() + ")");
}

std::string string_field(const nlohmann::json& doc, const char* key) {
  if(doc.contains(key) && doc.at(key).is_string()) {
    return doc.at(key).get<std::string>();
  }
  return {};
}

} // namespace

MediaSubject subject_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) {
    throw PreconditionError("Subject must be a JSON object");
  }
  MediaSubject subject;
  subject.id = read_id(doc);
  subject.title = string_field(doc, "title");
  if(subject.title.empty()) {
    throw PreconditionError("Subject " + std::to_string(subject.id) + " has no title");
  }

  if(doc.contains("movieFile")) {
    // catalog movie document
    const auto& movie_file = doc.at("movieFile");
    if(!movie_file.is_object() || string_field(movie_file, "path").empty()) {
      throw PreconditionError("Movie '" + subject.title + "' has no file");
    }
    subject.location = string_field(movie_file, "path");
    subject.folder = string_field(doc, "path");
    subject.record = doc;
    return subject;
  }

  subject.location = string_field(doc, "location");
  if(subject.location.empty()) {
    throw PreconditionError("Subject '" + subject.title + "' has no location");
  }
  subject.folder = string_field(doc, "folder");
  if(doc.contains("record") && doc.at("record").is_object()) {
    subject.record = doc.at("record");
  }
  return subject;
}

nlohmann::json subject_to_json(const MediaSubject& subject) {
  nlohmann::json doc = {
    {"id", subject.id},
    {"title", subject.title},
    {"location", subject.location.string()}
  };
  if(!subject.folder.empty()) {
    doc["folder"] = subject.folder.string();
  }
  if(!subject.record.empty()) {
    doc["record"] = subject.record;
  }
  return doc;
}
