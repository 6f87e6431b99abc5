#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "margin_cli/app_context.hpp"
#include "margin_core/config/settings_store.hpp"

namespace margin_cli
{

  enum class Command
  {
    NotebookAdd,
    NotebookList,
    Ingest,
    Query,
    Search,
    Related,
    DeleteSource,
    DeleteNotebook,
    Reembed,
    Status,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string notebook_id;
    std::string source_id;
    std::string title;
    std::string file_path;
    std::string question;
    std::vector<std::string> source_filter;
    std::vector<std::string> notebook_filter;
    int top_k = 5;
    bool force = false;
    bool standard = false;  // standard retrieval instead of agentic
    bool json = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(std::shared_ptr<margin_core::SettingsStore> settings);
    ~CliHandler();

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments. Does not touch the data directory.
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    // Splits "a,b, c" into {"a", "b", "c"}, dropping empty items
    static std::vector<std::string> split_list(const std::string &value);

  private:
    std::shared_ptr<margin_core::SettingsStore> settings_;
    std::unique_ptr<AppContext> context_;

    AppContext &context();

    // Command handlers
    void handle_notebook_add_command(const CliOptions &options);
    void handle_notebook_list_command(const CliOptions &options);
    void handle_ingest_command(const CliOptions &options);
    void handle_query_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_related_command(const CliOptions &options);
    void handle_delete_source_command(const CliOptions &options);
    void handle_delete_notebook_command(const CliOptions &options);
    void handle_reembed_command(const CliOptions &options);
    void handle_status_command(const CliOptions &options);

    // Helper methods
    static std::unordered_map<std::string, std::string> collect_flags(int argc, char *argv[]);
    static std::string read_file(const std::string &path);
    void print_json_response(const nlohmann::json &response);
    void print_help();
  };

}  // namespace margin_cli
