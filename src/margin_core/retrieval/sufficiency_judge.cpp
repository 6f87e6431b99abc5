#include "margin_core/retrieval/sufficiency_judge.hpp"

#include <utility>

#include "margin_core/util/text.hpp"

namespace margin_core {

LlmSufficiencyJudge::LlmSufficiencyJudge(std::shared_ptr<ProviderFactory> providers)
    : providers_(std::move(providers)) {}

std::string LlmSufficiencyJudge::build_prompt(const std::string& question, const std::string& context) {
  return "Given this question and the retrieved context, is the context sufficient to answer the "
         "question well? Answer with ONLY \"yes\" or \"no\".\n\n"
         "Question: \"" + question + "\"\n\n"
         "Retrieved context (first " + std::to_string(PROMPT_CONTEXT_CHARS) + " chars):\n" +
         text::truncate_chars(text::sanitize_utf8(context), PROMPT_CONTEXT_CHARS);
}

bool LlmSufficiencyJudge::parse_verdict(const std::string& answer) {
  return text::to_lower(text::trim(answer)).rfind("no", 0) != 0;
}

bool LlmSufficiencyJudge::is_sufficient(const std::string& question, const std::string& context) {
  auto generator = providers_->text_generator();
  if (!generator) {
    throw TextGenerationError("No text generator is configured");
  }
  return parse_verdict(generator->generate_text(build_prompt(question, context)));
}

}  // namespace margin_core
