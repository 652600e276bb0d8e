#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "lens_cli/cli_handler.hpp"

namespace {

lens_core::CancellationToken g_cancel;

void handle_interrupt(int /*signal*/) {
  g_cancel.cancel();
}

lens_core::Config load_config() {
  const char *config_path = std::getenv("LENS_CONFIG");
  if (config_path && *config_path) {
    return lens_core::Config::from_file(config_path);
  }
  if (std::filesystem::exists("lensrc.json")) {
    return lens_core::Config::from_file("lensrc.json");
  }
  return lens_core::Config::from_json(nlohmann::json::object());
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    lens_cli::CliOptions options = lens_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == lens_cli::Command::Help) {
      lens_cli::CliHandler::print_help();
      return 0;
    }

    std::signal(SIGINT, handle_interrupt);

    lens_cli::CliHandler handler(load_config(), &g_cancel);
    handler.execute_command(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
