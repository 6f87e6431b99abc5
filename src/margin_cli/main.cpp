#include "margin_cli/cli_handler.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>

int main(int argc, char *argv[])
{
  try
  {
    // Config file from the environment, defaults when it does not exist
    const char *config_env = std::getenv("MARGIN_CONFIG");
    std::filesystem::path config_path = config_env ? config_env : "marginrc.json";

    std::shared_ptr<margin_core::SettingsStore> settings;
    if (std::filesystem::exists(config_path))
    {
      settings = std::make_shared<margin_core::SettingsStore>(config_path);
    }
    else
    {
      settings = std::make_shared<margin_core::SettingsStore>(margin_core::Settings::from_json(nlohmann::json::object()));
    }

    margin_cli::CliHandler handler(settings);

    // Parse command line arguments
    margin_cli::CliOptions options = handler.parse_arguments(argc, argv);

    // Execute the command
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
