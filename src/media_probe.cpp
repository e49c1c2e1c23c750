#include "media_probe.hpp"

#include <cstdlib>

#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace {

double number_or_string(const nlohmann::json& value) {
  if(value.is_number()) return value.get<double>();
  if(value.is_string()) {
    const auto text = value.get<std::string>();
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if(end != text.c_str()) return parsed;
  }
  return 0.0;
}

} // namespace

MediaProbe parse_ffprobe_json(const std::string& text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text);
  } catch(const nlohmann::json::parse_error& e) {
    throw TransformError(std::string("Unable to parse probe output: ") + e.what());
  }
  if(!doc.is_object()) {
    throw TransformError("Probe output is not a JSON object");
  }

  MediaProbe probe;
  try {
    if(doc.contains("streams") && doc.at("streams").is_array()) {
      for(const auto& entry : doc.at("streams")) {
        MediaStream stream;
        stream.index = entry.value("index", -1);
        stream.type = entry.value("codec_type", "");
        stream.codec_name = entry.value("codec_name", "");
        stream.channel_layout = entry.value("channel_layout", "");
        stream.channels = entry.value("channels", 0);
        probe.streams.push_back(std::move(stream));
      }
    }
    if(doc.contains("format") && doc.at("format").contains("duration")) {
      probe.duration_seconds = number_or_string(doc.at("format").at("duration"));
    }
  } catch(const nlohmann::json::exception& e) {
    throw TransformError(std::string("Malformed probe output: ") + e.what());
  }
  return probe;
}

FfprobeMediaProber::FfprobeMediaProber(std::string ffprobe_path, ProcessLauncher launcher)
  : ffprobe_path_(std::move(ffprobe_path)),
    launcher_(launcher ? std::move(launcher) : default_process_launcher()) {}

MediaProbe FfprobeMediaProber::probe(const std::filesystem::path& path) {
  if(!std::filesystem::is_regular_file(path)) {
    throw PreconditionError("Media file not found: " + path.string());
  }
  ProcessRequest request;
  request.argv = {ffprobe_path_, "-v", "quiet", "-print_format", "json",
                  "-show_streams", "-show_format", path.string()};
  std::string output;
  auto result = launcher_(request, [&](const std::string& line){
    output += line;
    output += '\n';
  });
  if(result.exit_code != 0) {
    throw TransformError("Failed to probe " + path.string() + " (exit " +
                         std::to_string(result.exit_code) + "): " + result.tail_text());
  }
  return parse_ffprobe_json(output);
}
