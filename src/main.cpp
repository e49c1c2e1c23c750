#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <string>

#include "mover_service.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    MoverService::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "safemover");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      print_err("{}", error);
      parser.usage(*settings);
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    options.start_console = !settings->get<bool>("no_console");
    MoverService service(settings, options);
    auto logger = service.logger();

    service.start();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    service.run();
    service.stop();

    return 0;
  } catch(std::exception& e) {
    init();
    Logger logger("safemover-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
