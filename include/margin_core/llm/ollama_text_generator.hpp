#pragma once

#include <string>

#include "margin_core/llm/text_generator.hpp"

namespace margin_core {

class OllamaTextGenerator : public TextGenerator {
 public:
  OllamaTextGenerator(const std::string& ollama_url, const std::string& model);

  std::string generate_text(const std::string& prompt) override;

 private:
  std::string ollama_url_;
  std::string model_;
};

}  // namespace margin_core
