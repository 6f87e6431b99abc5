#include "margin_core/retrieval/sub_query_planner.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "margin_core/util/text.hpp"

namespace margin_core {

namespace {

void erase_all(std::string& haystack, const std::string& needle) {
  for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos)) {
    haystack.erase(pos, needle.size());
  }
}

}  // namespace

std::string SubQueryPlanner::build_prompt(const std::string& question) {
  return "You are a search query optimizer. Given the user's question, generate 2-3 targeted search "
         "queries that would help find the most relevant information in a document collection. Each "
         "query should approach the topic from a different angle.\n\n"
         "User question: \"" + question + "\"\n\n"
         "Output a JSON array of strings, each being a search query. Output ONLY the JSON array, no "
         "markdown fences.\n"
         "Example: [\"query 1\", \"query 2\", \"query 3\"]";
}

std::vector<std::string> SubQueryPlanner::parse_response(const std::string& response,
                                                         const std::string& question) {
  std::string raw = response;
  erase_all(raw, "```json");
  erase_all(raw, "```");
  raw = text::trim(raw);

  // Tolerate prose around the array
  const size_t open = raw.find('[');
  const size_t close = raw.rfind(']');
  if (open == std::string::npos || close == std::string::npos || close < open) {
    return {question};
  }

  nlohmann::json parsed = nlohmann::json::parse(raw.substr(open, close - open + 1), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array()) {
    return {question};
  }

  std::vector<std::string> queries;
  for (const auto& item : parsed) {
    if (queries.size() >= MAX_SUB_QUERIES) {
      break;
    }
    std::string query = text::trim(item.is_string() ? item.get<std::string>() : item.dump());
    if (!query.empty()) {
      queries.push_back(std::move(query));
    }
  }
  if (queries.empty()) {
    return {question};
  }
  return queries;
}

std::vector<std::string> SubQueryPlanner::plan(TextGenerator* generator, const std::string& question) {
  if (generator == nullptr) {
    return {question};
  }
  try {
    return parse_response(generator->generate_text(build_prompt(question)), question);
  } catch (const std::exception& e) {
    std::cerr << "[SubQueryPlanner] Falling back to the original question: " << e.what() << std::endl;
    return {question};
  }
}

}  // namespace margin_core
