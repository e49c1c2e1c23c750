#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "media_probe.hpp"
#include "operation_handler.hpp"
#include "process_runner.hpp"

class CatalogClient;
class Logger;
class SafeTransfer;

// Source track selection and naming for the DTS 5.1(side) -> FLAC 7.1 profile.
std::optional<MediaStream> find_convertible_stream(const MediaProbe& probe);

// Seconds from an ffmpeg "-stats" line ("... time=01:02:03.45 ..."), if any.
std::optional<double> parse_ffmpeg_time(const std::string& line);

// File name after conversion. Unchanged when already tagged.
std::string converted_file_name(const std::string& file_name);

// `desired`, or desired with _1, _2, ... appended to the stem when taken.
std::filesystem::path unique_path(const std::filesystem::path& desired);

// Re-encodes the DTS track to FLAC 7.1, remuxes it in as the default audio
// track, swaps the container in place and renames it.
class ConvertOperation : public OperationHandler {
public:
  struct Options {
    std::filesystem::path slow_root;      // files below it convert at background priority
    std::filesystem::path temp_dir = "/tmp";
    std::string ffmpeg_path = "ffmpeg";
    std::string mkvmerge_path = "mkvmerge";
  };

  ConvertOperation(Options options,
                   std::shared_ptr<MediaProber> prober,
                   ProcessLauncher launcher,
                   std::shared_ptr<SafeTransfer> transfer,
                   std::shared_ptr<CatalogClient> catalog,
                   std::shared_ptr<Logger> logger);

  void execute(const MediaSubject& subject,
               const StatusCallback& update_status,
               const ProgressCallback& update_progress) override;

  std::vector<std::string> transcode_command(const std::filesystem::path& source,
                                             const MediaStream& stream,
                                             const std::filesystem::path& output) const;
  std::vector<std::string> remux_command(const std::filesystem::path& source,
                                         const MediaProbe& probe,
                                         const std::filesystem::path& audio,
                                         const std::filesystem::path& output) const;

private:
  void transcode(const std::filesystem::path& source,
                 const MediaStream& stream,
                 double duration_seconds,
                 const std::filesystem::path& output,
                 bool background,
                 const ProgressCallback& update_progress) const;
  void remux(const std::filesystem::path& source,
             const MediaProbe& probe,
             const std::filesystem::path& audio,
             const std::filesystem::path& output,
             bool background) const;
  std::filesystem::path rename_converted(const std::filesystem::path& file) const;

  Options options_;
  std::shared_ptr<MediaProber> prober_;
  ProcessLauncher launcher_;
  std::shared_ptr<SafeTransfer> transfer_;
  std::shared_ptr<CatalogClient> catalog_;
  std::shared_ptr<Logger> logger_;
};
