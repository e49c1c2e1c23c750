#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "process_runner.hpp"

struct MediaStream {
  int index = -1;
  std::string type;             // "audio", "video", "subtitle", ...
  std::string codec_name;
  std::string channel_layout;
  int channels = 0;
};

struct MediaProbe {
  std::vector<MediaStream> streams;
  double duration_seconds = 0.0;
};

class MediaProber {
public:
  virtual ~MediaProber() = default;
  virtual MediaProbe probe(const std::filesystem::path& path) = 0;
};

// ffprobe -print_format json output -> MediaProbe. Throws TransformError.
MediaProbe parse_ffprobe_json(const std::string& text);

class FfprobeMediaProber : public MediaProber {
public:
  explicit FfprobeMediaProber(std::string ffprobe_path = "ffprobe",
                              ProcessLauncher launcher = default_process_launcher());

  MediaProbe probe(const std::filesystem::path& path) override;

private:
  std::string ffprobe_path_;
  ProcessLauncher launcher_;
};
