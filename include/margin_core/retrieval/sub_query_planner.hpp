#pragma once

#include <string>
#include <vector>

#include "margin_core/llm/text_generator.hpp"

namespace margin_core {

// Asks the text generator to decompose a question into focused search queries.
class SubQueryPlanner {
 public:
  static constexpr size_t MAX_SUB_QUERIES = 3;

  // Never fails: any generator error or unparseable answer yields {question}.
  static std::vector<std::string> plan(TextGenerator* generator, const std::string& question);

  static std::string build_prompt(const std::string& question);

  // Expects a JSON array of strings, optionally inside a ``` fence. Returns
  // {question} when nothing usable is found.
  static std::vector<std::string> parse_response(const std::string& response, const std::string& question);
};

}  // namespace margin_core
