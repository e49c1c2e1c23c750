#include "convert_operation.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

#include <unistd.h>

#include "catalog_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "safe_transfer.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr const char* kSourceCodecPrefix = "dts";
constexpr const char* kSourceLayout = "5.1(side)";
constexpr const char* kTargetCodec = "flac";
constexpr const char* kTargetTag = "FLAC.7.1";
constexpr const char* kTrackName = "FLAC 7.1";
constexpr const char* kPanFilter = "pan=7.1|FL=FL|FR=FR|FC=FC|LFE=LFE|BL=SL|BR=SR|SL=SL|SR=SR";

// First match wins.
const std::vector<std::string>& source_name_fragments() {
  static const std::vector<std::string> fragments = {
    R"(DTS[.A-Za-z-]*5\.1)",
    R"(DTS-HD[. ]?MA)",
    R"(DTS-HD)",
    R"(DTS-ES)",
    R"(DTS-X)",
    R"(\bDTS\b)"
  };
  return fragments;
}

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

class TempFiles {
public:
  TempFiles(std::vector<fs::path> paths, Logger* logger)
    : paths_(std::move(paths)), logger_(logger) {}

  ~TempFiles() {
    for(const auto& path : paths_) {
      std::error_code ec;
      if(fs::remove(path, ec)) {
        log_debug(logger_, "Removed temporary file {}", path.string());
      } else if(ec) {
        log_warn(logger_, "Unable to remove temporary file {}: {}", path.string(), ec.message());
      }
    }
  }

  TempFiles(const TempFiles&) = delete;
  TempFiles& operator=(const TempFiles&) = delete;

private:
  std::vector<fs::path> paths_;
  Logger* logger_;
};

bool non_empty_file(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && fs::file_size(path, ec) > 0 && !ec;
}

} // namespace

std::optional<MediaStream> find_convertible_stream(const MediaProbe& probe) {
  for(const auto& stream : probe.streams) {
    if(stream.type != "audio") continue;
    if(stream.codec_name.rfind(kSourceCodecPrefix, 0) != 0) continue;
    if(stream.channel_layout != kSourceLayout) continue;
    return stream;
  }
  return std::nullopt;
}

std::optional<double> parse_ffmpeg_time(const std::string& line) {
  static const std::regex time_pattern(R"(time=(\d+):(\d+):(\d+\.\d+))");
  std::smatch match;
  if(!std::regex_search(line, match, time_pattern)) return std::nullopt;
  return std::stod(match[1].str()) * 3600.0 +
         std::stod(match[2].str()) * 60.0 +
         std::stod(match[3].str());
}

std::string converted_file_name(const std::string& file_name) {
  fs::path name(file_name);
  std::string stem = name.stem().string();
  std::string extension = name.extension().string();
  if(lowercase(stem).find(lowercase(kTargetTag)) != std::string::npos) {
    return file_name;
  }
  for(const auto& fragment : source_name_fragments()) {
    std::regex pattern(fragment, std::regex::ECMAScript | std::regex::icase);
    if(std::regex_search(stem, pattern)) {
      return std::regex_replace(stem, pattern, kTargetTag,
                                std::regex_constants::format_first_only) + extension;
    }
  }
  return stem + "." + kTargetTag + extension;
}

fs::path unique_path(const fs::path& desired) {
  std::error_code ec;
  if(!fs::exists(desired, ec)) return desired;
  const auto parent = desired.parent_path();
  const auto stem = desired.stem().string();
  const auto extension = desired.extension().string();
  for(int n = 1;; ++n) {
    auto candidate = parent / (stem + "_" + std::to_string(n) + extension);
    if(!fs::exists(candidate, ec)) return candidate;
  }
}

ConvertOperation::ConvertOperation(Options options,
                                   std::shared_ptr<MediaProber> prober,
                                   ProcessLauncher launcher,
                                   std::shared_ptr<SafeTransfer> transfer,
                                   std::shared_ptr<CatalogClient> catalog,
                                   std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    prober_(std::move(prober)),
    launcher_(launcher ? std::move(launcher) : default_process_launcher()),
    transfer_(std::move(transfer)),
    catalog_(std::move(catalog)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("convert")) {
  if(!prober_ || !transfer_ || !catalog_) {
    throw std::invalid_argument("ConvertOperation needs a prober, a transfer engine and a catalog client");
  }
}

std::vector<std::string> ConvertOperation::transcode_command(const fs::path& source,
                                                             const MediaStream& stream,
                                                             const fs::path& output) const {
  return {
    options_.ffmpeg_path, "-nostdin", "-y",
    "-i", source.string(),
    "-map", "0:" + std::to_string(stream.index),
    "-vn",
    "-c:a", kTargetCodec,
    "-compression_level", "8",
    "-channel_layout", "7.1",
    "-ac", "8",
    "-af", kPanFilter,
    "-loglevel", "warning",
    "-stats",
    output.string()
  };
}

std::vector<std::string> ConvertOperation::remux_command(const fs::path& source,
                                                         const MediaProbe& probe,
                                                         const fs::path& audio,
                                                         const fs::path& output) const {
  std::vector<std::string> args = {
    options_.mkvmerge_path, "-o", output.string(),
    "--track-name", std::string("0:") + kTrackName,
    "--language", "0:eng",
    "--default-track-flag", "0:yes",
    audio.string()
  };

  std::vector<std::string> dropped;
  std::vector<std::string> kept_audio;
  std::vector<std::string> video;
  for(const auto& stream : probe.streams) {
    const auto id = std::to_string(stream.index);
    if(stream.type == "audio") {
      if(stream.codec_name == kTargetCodec) {
        dropped.push_back(id);
      } else {
        kept_audio.push_back(id);
      }
    } else if(stream.type == "video") {
      video.push_back(id);
    }
  }

  if(!dropped.empty()) {
    std::string selector = "!";
    for(std::size_t i = 0; i < dropped.size(); ++i) {
      if(i > 0) selector += ",";
      selector += dropped[i];
    }
    args.push_back("--audio-tracks");
    args.push_back(selector);
  }
  for(const auto& id : kept_audio) {
    args.push_back("--default-track-flag");
    args.push_back(id + ":no");
  }
  args.push_back(source.string());

  // video, new audio, remaining audio; anything unlisted follows
  std::string order;
  auto append = [&](const std::string& entry) {
    if(!order.empty()) order += ",";
    order += entry;
  };
  for(const auto& id : video) append("1:" + id);
  append("0:0");
  for(const auto& id : kept_audio) append("1:" + id);
  args.push_back("--track-order");
  args.push_back(order);
  return args;
}

void ConvertOperation::transcode(const fs::path& source,
                                 const MediaStream& stream,
                                 double duration_seconds,
                                 const fs::path& output,
                                 bool background,
                                 const ProgressCallback& update_progress) const {
  ProcessRequest request;
  request.argv = transcode_command(source, stream, output);
  request.background_priority = background;

  auto result = launcher_(request, [&](const std::string& line) {
    auto elapsed = parse_ffmpeg_time(line);
    if(!elapsed) return;
    if(duration_seconds > 0.0) {
      double percent = std::min(100.0, *elapsed / duration_seconds * 100.0);
      update_progress(fmt::format("Converting: {:.1f}%", percent));
    } else {
      update_progress(fmt::format("Converting: {:.0f}s", *elapsed));
    }
  });
  if(result.exit_code != 0) {
    throw TransformError("Audio conversion failed (exit " + std::to_string(result.exit_code) +
                         "): " + result.tail_text());
  }
  if(!non_empty_file(output)) {
    throw TransformError("Audio conversion produced no output at " + output.string());
  }
}

void ConvertOperation::remux(const fs::path& source,
                             const MediaProbe& probe,
                             const fs::path& audio,
                             const fs::path& output,
                             bool background) const {
  ProcessRequest request;
  request.argv = remux_command(source, probe, audio, output);
  request.background_priority = background;

  auto result = launcher_(request, {});
  // mkvmerge: 0 ok, 1 finished with warnings, 2 error
  if(result.exit_code == 1) {
    logger_->warn("Remux of {} finished with warnings: {}", source.string(), result.tail_text());
  } else if(result.exit_code != 0) {
    throw TransformError("Failed to merge audio track (exit " + std::to_string(result.exit_code) +
                         "): " + result.tail_text());
  }
  if(!non_empty_file(output)) {
    throw TransformError("Remux produced no output at " + output.string());
  }
}

fs::path ConvertOperation::rename_converted(const fs::path& file) const {
  const auto new_name = converted_file_name(file.filename().string());
  if(new_name == file.filename().string()) {
    logger_->info("{} already carries the {} tag", file.string(), kTargetTag);
    return file;
  }
  const auto target = unique_path(file.parent_path() / new_name);
  fs::rename(file, target);
  logger_->info("Renamed {} -> {}", file.filename().string(), target.filename().string());
  return target;
}

void ConvertOperation::execute(const MediaSubject& subject,
                               const StatusCallback& update_status,
                               const ProgressCallback& update_progress) {
  update_status("copying");
  update_progress("Validating audio format...");

  const fs::path source = subject.location;
  if(!fs::is_regular_file(source)) {
    throw PreconditionError("Media file not found: " + source.string());
  }
  const auto probe = prober_->probe(source);
  const auto stream = find_convertible_stream(probe);
  if(!stream) {
    std::string found;
    for(const auto& s : probe.streams) {
      if(s.type != "audio") continue;
      if(!found.empty()) found += ", ";
      found += s.codec_name + " " + (s.channel_layout.empty() ? "?" : s.channel_layout);
    }
    throw PreconditionError("No DTS 5.1(side) audio track in " + source.string() +
                            " (audio found: " + (found.empty() ? "none" : found) + ")");
  }
  logger_->info("Converting stream {} ({} {}) of '{}', duration {:.0f}s",
                stream->index, stream->codec_name, stream->channel_layout,
                subject.title, probe.duration_seconds);

  const bool background = !options_.slow_root.empty() &&
                          relative_under(source, options_.slow_root).has_value();

  fs::create_directories(options_.temp_dir);
  const auto artifact_stem = fmt::format("safemover_{}_{}", subject.id, ::getpid());
  const auto audio_path = options_.temp_dir / (artifact_stem + ".flac");
  const auto remux_path = options_.temp_dir / (artifact_stem + ".mkv");
  TempFiles cleanup({audio_path, remux_path}, logger_.get());

  update_progress("Converting DTS to FLAC 7.1...");
  transcode(source, *stream, probe.duration_seconds, audio_path, background, update_progress);

  update_status("verifying");
  update_progress("Merging audio track...");
  remux(source, probe, audio_path, remux_path, background);

  update_status("updating");
  update_progress("Replacing original file...");
  TransferOptions transfer_options;
  transfer_options.background_priority = background;
  transfer_options.progress = [&](const std::string& text) {
    update_progress("Replacing: " + text);
  };
  transfer_->safe_replace(source, remux_path, transfer_options);

  const auto final_path = rename_converted(source);

  update_progress("Triggering catalog rescan...");
  try {
    catalog_->rescan(subject.id);
  } catch(const CatalogError& e) {
    throw CatalogError(std::string(e.what()) + " (converted file is at " + final_path.string() + ")");
  }
}
