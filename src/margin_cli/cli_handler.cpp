#include "margin_cli/cli_handler.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "margin_core/db/database_manager.hpp"
#include "margin_core/util/text.hpp"

namespace margin_cli {

using namespace margin_core;

namespace {

const std::unordered_set<std::string> kBooleanFlags = {"--force", "--standard", "--json"};

const std::unordered_map<std::string, std::string> kShortFlags = {
    {"-n", "--notebook"}, {"-s", "--source"}, {"-f", "--file"},  {"-t", "--title"},
    {"-q", "--query"},    {"-k", "--top-k"},  {"-i", "--id"},
};

std::string flag_or_empty(const std::unordered_map<std::string, std::string>& flags, const std::string& name) {
    auto it = flags.find(name);
    return it == flags.end() ? std::string() : it->second;
}

std::string require_flag(const std::unordered_map<std::string, std::string>& flags,
                         const std::string& name,
                         const std::string& usage) {
    std::string value = flag_or_empty(flags, name);
    if (text::is_blank(value)) {
        throw CliError("Missing " + name + ". Usage: " + usage);
    }
    return value;
}

int parse_top_k(const std::unordered_map<std::string, std::string>& flags, int default_value) {
    std::string value = flag_or_empty(flags, "--top-k");
    if (value.empty()) {
        return default_value;
    }
    int parsed = 0;
    try {
        parsed = std::stoi(value);
    } catch (const std::exception&) {
        throw CliError("--top-k must be a positive integer, got: " + value);
    }
    if (parsed <= 0) {
        throw CliError("--top-k must be a positive integer, got: " + value);
    }
    return parsed;
}

std::string page_suffix(const std::optional<int>& page_number) {
    return page_number ? " p." + std::to_string(*page_number) : std::string();
}

}  // namespace

CliHandler::CliHandler(std::shared_ptr<SettingsStore> settings) : settings_(std::move(settings)) {}

CliHandler::~CliHandler() = default;

AppContext& CliHandler::context() {
    if (!context_) {
        context_ = std::make_unique<AppContext>(settings_);
    }
    return *context_;
}

std::vector<std::string> CliHandler::split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = text::trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::unordered_map<std::string, std::string> CliHandler::collect_flags(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> flags;
    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (auto alias = kShortFlags.find(flag); alias != kShortFlags.end()) {
            flag = alias->second;
        }
        if (kBooleanFlags.count(flag)) {
            flags[flag] = "true";
            continue;
        }
        if (flag.rfind("-", 0) != 0) {
            throw CliError("Unexpected argument: " + flag);
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        flags[flag] = argv[++i];
    }
    return flags;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    }

    const auto flags = collect_flags(argc, argv);
    options.force = flags.count("--force") > 0;
    options.standard = flags.count("--standard") > 0;
    options.json = flags.count("--json") > 0;

    if (command == "notebook-add" || command == "na") {
        options.command = Command::NotebookAdd;
        options.notebook_id = require_flag(flags, "--id", "notebook-add --id <notebook_id> [--title <title>]");
        options.title = flag_or_empty(flags, "--title");
    } else if (command == "notebooks" || command == "nl") {
        options.command = Command::NotebookList;
    } else if (command == "ingest" || command == "i") {
        const std::string usage = "ingest --notebook <id> --source <id> --file <path> [--title <title>] [--force]";
        options.command = Command::Ingest;
        options.notebook_id = require_flag(flags, "--notebook", usage);
        options.source_id = require_flag(flags, "--source", usage);
        options.file_path = require_flag(flags, "--file", usage);
        options.title = flag_or_empty(flags, "--title");
    } else if (command == "query" || command == "q") {
        const std::string usage = "query --notebook <id> --query <question> [--sources a,b] [--standard]";
        options.command = Command::Query;
        options.notebook_id = require_flag(flags, "--notebook", usage);
        options.question = require_flag(flags, "--query", usage);
        options.source_filter = split_list(flag_or_empty(flags, "--sources"));
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
        options.question = require_flag(flags, "--query", "search --query <query> [--notebooks a,b] [--top-k <n>]");
        options.notebook_filter = split_list(flag_or_empty(flags, "--notebooks"));
        options.top_k = parse_top_k(flags, static_cast<int>(SearchService::DEFAULT_LIMIT));
    } else if (command == "related" || command == "r") {
        const std::string usage = "related --notebook <id> --source <id> [--top-k <n>]";
        options.command = Command::Related;
        options.notebook_id = require_flag(flags, "--notebook", usage);
        options.source_id = require_flag(flags, "--source", usage);
        options.top_k = parse_top_k(flags, static_cast<int>(RecommendationService::DEFAULT_LIMIT));
    } else if (command == "delete-source" || command == "ds") {
        const std::string usage = "delete-source --notebook <id> --source <id>";
        options.command = Command::DeleteSource;
        options.notebook_id = require_flag(flags, "--notebook", usage);
        options.source_id = require_flag(flags, "--source", usage);
    } else if (command == "delete-notebook" || command == "dn") {
        options.command = Command::DeleteNotebook;
        options.notebook_id = require_flag(flags, "--notebook", "delete-notebook --notebook <id>");
    } else if (command == "reembed" || command == "re") {
        options.command = Command::Reembed;
        options.notebook_id = require_flag(flags, "--notebook", "reembed --notebook <id>");
    } else if (command == "status" || command == "st") {
        options.command = Command::Status;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::NotebookAdd:
            handle_notebook_add_command(options);
            break;
        case Command::NotebookList:
            handle_notebook_list_command(options);
            break;
        case Command::Ingest:
            handle_ingest_command(options);
            break;
        case Command::Query:
            handle_query_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Related:
            handle_related_command(options);
            break;
        case Command::DeleteSource:
            handle_delete_source_command(options);
            break;
        case Command::DeleteNotebook:
            handle_delete_notebook_command(options);
            break;
        case Command::Reembed:
            handle_reembed_command(options);
            break;
        case Command::Status:
            handle_status_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_notebook_add_command(const CliOptions& options) {
    auto& metadata = *context().metadata_store;
    NotebookRecord notebook;
    notebook.id = options.notebook_id;
    notebook.title = options.title.empty() ? options.notebook_id : options.title;
    auto existing = metadata.get_notebook(options.notebook_id);
    notebook.created_at = existing ? existing->created_at : std::chrono::system_clock::now();
    metadata.upsert_notebook(notebook);
    std::cout << (existing ? "Updated" : "Created") << " notebook " << notebook.id << " (" << notebook.title << ")"
              << std::endl;
}

void CliHandler::handle_notebook_list_command(const CliOptions& options) {
    auto& metadata = *context().metadata_store;
    auto notebooks = metadata.list_notebooks();
    if (options.json) {
        nlohmann::json response = nlohmann::json::array();
        for (const auto& notebook : notebooks) {
            response.push_back({{"id", notebook.id},
                                {"title", notebook.title},
                                {"sources", metadata.list_sources(notebook.id).size()}});
        }
        print_json_response(response);
        return;
    }
    if (notebooks.empty()) {
        std::cout << "No notebooks yet. Create one with: notebook-add --id <id>" << std::endl;
        return;
    }
    for (const auto& notebook : notebooks) {
        std::cout << "  " << notebook.id << "  " << notebook.title << "  ("
                  << metadata.list_sources(notebook.id).size() << " sources)" << std::endl;
    }
}

void CliHandler::handle_ingest_command(const CliOptions& options) {
    IngestRequest request;
    request.notebook_id = options.notebook_id;
    request.source_id = options.source_id;
    request.title = options.title.empty() ? options.file_path : options.title;
    request.text = read_file(options.file_path);
    request.force = options.force;

    if (!options.json) {
        std::cout << "Ingesting " << options.file_path << " into " << options.notebook_id << std::endl;
    }
    IngestResult result = context().ingestion->ingest_source(request);

    if (options.json) {
        print_json_response({{"source_id", result.source_id},
                             {"chunks", result.chunk_count},
                             {"embedded", result.embedded_count},
                             {"tier", result.tier ? nlohmann::json(to_string(*result.tier)) : nlohmann::json(nullptr)},
                             {"skipped", result.skipped}});
        return;
    }
    if (result.skipped) {
        std::cout << "Unchanged, " << result.chunk_count << " chunk(s) already indexed" << std::endl;
    } else if (result.tier) {
        std::cout << "Indexed " << result.embedded_count << "/" << result.chunk_count << " chunk(s) with the "
                  << to_string(*result.tier) << " tier" << std::endl;
    } else {
        std::cout << "Saved " << result.chunk_count << " chunk(s) without vectors; run reembed later" << std::endl;
    }
}

void CliHandler::handle_query_command(const CliOptions& options) {
    std::optional<std::vector<std::string>> sources;
    if (!options.source_filter.empty()) {
        sources = options.source_filter;
    }
    QueryOptions query_options;
    query_options.agentic = !options.standard;

    RagResult result = context().retrieval->query(options.notebook_id, options.question, sources, {}, query_options);

    if (options.json) {
        nlohmann::json citations = nlohmann::json::array();
        for (const auto& citation : result.citations) {
            nlohmann::json entry = {{"source_id", citation.source_id},
                                    {"source_title", citation.source_title},
                                    {"chunk_text", citation.chunk_text}};
            entry["page_number"] = citation.page_number ? nlohmann::json(*citation.page_number) : nullptr;
            citations.push_back(std::move(entry));
        }
        print_json_response({{"context", result.context}, {"citations", citations}});
        return;
    }

    if (result.context.empty()) {
        std::cout << "No relevant context found." << std::endl;
        return;
    }
    std::cout << "\n=== Context ===\n" << result.context << std::endl;
    std::cout << "\n=== Citations ===" << std::endl;
    for (size_t i = 0; i < result.citations.size(); ++i) {
        const auto& citation = result.citations[i];
        std::cout << "  [" << (i + 1) << "] " << citation.source_title << page_suffix(citation.page_number) << ": "
                  << citation.chunk_text << std::endl;
    }
}

void CliHandler::handle_search_command(const CliOptions& options) {
    auto results = context().search->search_global(options.question, options.notebook_filter,
                                                   static_cast<size_t>(options.top_k));
    if (options.json) {
        nlohmann::json response = nlohmann::json::array();
        for (const auto& result : results) {
            nlohmann::json entry = {{"notebook_id", result.notebook_id},   {"notebook_title", result.notebook_title},
                                    {"source_id", result.source_id},       {"source_title", result.source_title},
                                    {"text", result.text},                 {"score", result.score}};
            entry["page_number"] = result.page_number ? nlohmann::json(*result.page_number) : nullptr;
            response.push_back(std::move(entry));
        }
        print_json_response(response);
        return;
    }

    std::cout << "Search for: " << options.question << " (top_k: " << options.top_k << ")" << std::endl;
    if (results.empty()) {
        std::cout << "No results." << std::endl;
        return;
    }
    for (const auto& result : results) {
        std::cout << "  " << result.notebook_title << " / " << result.source_title << page_suffix(result.page_number)
                  << " (score: " << std::fixed << std::setprecision(3) << result.score << ")" << std::endl;
        std::cout << "    " << result.text << std::endl;
    }
}

void CliHandler::handle_related_command(const CliOptions& options) {
    auto recommendations = context().recommendations->find_related_sources(
        options.notebook_id, options.source_id, static_cast<size_t>(options.top_k));
    if (options.json) {
        nlohmann::json response = nlohmann::json::array();
        for (const auto& rec : recommendations) {
            response.push_back({{"notebook_id", rec.notebook_id},
                                {"notebook_title", rec.notebook_title},
                                {"source_id", rec.source_id},
                                {"source_title", rec.source_title},
                                {"score", rec.score}});
        }
        print_json_response(response);
        return;
    }
    if (recommendations.empty()) {
        std::cout << "No related sources in other notebooks." << std::endl;
        return;
    }
    for (const auto& rec : recommendations) {
        std::cout << "  " << rec.notebook_title << " / " << rec.source_title << " (score: " << std::fixed
                  << std::setprecision(3) << rec.score << ")" << std::endl;
    }
}

void CliHandler::handle_delete_source_command(const CliOptions& options) {
    context().ingestion->delete_source(options.notebook_id, options.source_id);
    std::cout << "Deleted source " << options.source_id << std::endl;
}

void CliHandler::handle_delete_notebook_command(const CliOptions& options) {
    context().ingestion->delete_notebook(options.notebook_id);
    std::cout << "Deleted notebook " << options.notebook_id << std::endl;
}

void CliHandler::handle_reembed_command(const CliOptions& options) {
    auto results = context().ingestion->reembed_notebook(options.notebook_id);
    if (results.empty()) {
        std::cout << "Every source in " << options.notebook_id << " is up to date." << std::endl;
        return;
    }
    for (const auto& result : results) {
        std::cout << "  " << result.source_id << ": "
                  << (result.tier ? to_string(*result.tier) : std::string("not embedded")) << " ("
                  << result.embedded_count << "/" << result.chunk_count << " chunks)" << std::endl;
    }
}

void CliHandler::handle_status_command(const CliOptions& options) {
    const Settings settings = settings_->current();
    auto& app = context();
    const EmbeddingTier active = app.embedder->get_active_model();

    nlohmann::json notebooks = nlohmann::json::array();
    for (const auto& notebook : app.metadata_store->list_notebooks()) {
        notebooks.push_back({{"id", notebook.id},
                             {"sources", app.metadata_store->list_sources(notebook.id).size()},
                             {"stale", app.ingestion->stale_sources(notebook.id).size()}});
    }

    auto& db = DatabaseManager::get_instance();
    nlohmann::json status = {{"data_dir", settings.data_dir},
                             {"metadata_db", db.db_path().string()},
                             {"idle_db_connections", db.available_connections()},
                             {"embedding_mode", to_string(settings.embedding_mode)},
                             {"active_tier", to_string(active)},
                             {"remote_configured", !settings.remote_api_key.empty()},
                             {"notebooks", notebooks}};
    if (options.json) {
        print_json_response(status);
        return;
    }

    std::cout << "Data directory:  " << settings.data_dir << std::endl;
    std::cout << "Metadata DB:     " << db.db_path().string() << std::endl;
    std::cout << "Embedding mode:  " << to_string(settings.embedding_mode) << std::endl;
    std::cout << "Active tier:     " << to_string(active) << std::endl;
    std::cout << "Remote API key:  " << (settings.remote_api_key.empty() ? "not set" : "set") << std::endl;
    for (const auto& notebook : notebooks) {
        std::cout << "  " << notebook["id"].get<std::string>() << ": " << notebook["sources"].get<size_t>()
                  << " source(s), " << notebook["stale"].get<size_t>() << " need re-embedding" << std::endl;
    }
}

std::string CliHandler::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CliError("Failed to open file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_help() {
    std::cout << "Margin - notebook retrieval and recommendations\n\n"
              << "Usage: margin <command> [options]\n\n"
              << "Commands:\n"
              << "  notebook-add, na     Create or rename a notebook\n"
              << "                       --id, -i <id> [--title, -t <title>]\n"
              << "  notebooks, nl        List notebooks\n"
              << "  ingest, i            Chunk, embed and index a text file\n"
              << "                       --notebook, -n <id> --source, -s <id> --file, -f <path>\n"
              << "                       [--title, -t <title>] [--force]\n"
              << "  query, q             Retrieve grounded context for a question\n"
              << "                       --notebook, -n <id> --query, -q <question>\n"
              << "                       [--sources a,b] [--standard]\n"
              << "  search, s            Search across notebooks\n"
              << "                       --query, -q <query> [--notebooks a,b] [--top-k, -k <n>]\n"
              << "  related, r           Sources in other notebooks similar to a source\n"
              << "                       --notebook, -n <id> --source, -s <id> [--top-k, -k <n>]\n"
              << "  delete-source, ds    --notebook, -n <id> --source, -s <id>\n"
              << "  delete-notebook, dn  --notebook, -n <id>\n"
              << "  reembed, re          Re-embed sources indexed by another tier\n"
              << "                       --notebook, -n <id>\n"
              << "  status, st           Show configuration and index health\n"
              << "  help, h              Show this help\n\n"
              << "Every command accepts --json for machine-readable output.\n\n"
              << "Environment:\n"
              << "  MARGIN_CONFIG        Path to the JSON config file (default: marginrc.json)\n"
              << "  MARGIN_API_KEY       API key for the remote provider\n"
              << std::endl;
}

}  // namespace margin_cli
