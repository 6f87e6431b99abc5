#pragma once

#include <memory>
#include <string>

#include "margin_core/embeddings/provider_factory.hpp"

namespace margin_core {

// Decides whether retrieved context is enough to answer a question.
class SufficiencyJudge {
 public:
  virtual ~SufficiencyJudge() = default;
  virtual bool is_sufficient(const std::string& question, const std::string& context) = 0;
};

// Asks the configured text generator for a yes/no verdict on the first
// PROMPT_CONTEXT_CHARS characters of context. Only an answer starting with
// "no" counts as insufficient.
class LlmSufficiencyJudge : public SufficiencyJudge {
 public:
  static constexpr size_t PROMPT_CONTEXT_CHARS = 2000;

  explicit LlmSufficiencyJudge(std::shared_ptr<ProviderFactory> providers);

  bool is_sufficient(const std::string& question, const std::string& context) override;

  static std::string build_prompt(const std::string& question, const std::string& context);
  static bool parse_verdict(const std::string& answer);

 private:
  std::shared_ptr<ProviderFactory> providers_;
};

}  // namespace margin_core
