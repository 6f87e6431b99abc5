#include "margin_core/llm/ollama_text_generator.hpp"

#include "ollama.hpp"

#include "margin_core/llm/ollama_client_lock.hpp"

namespace margin_core {

OllamaTextGenerator::OllamaTextGenerator(const std::string& ollama_url, const std::string& model)
    : ollama_url_(ollama_url), model_(model) {}

std::string OllamaTextGenerator::generate_text(const std::string& prompt) {
  std::lock_guard<std::mutex> client_lock(ollama_client_mutex());
  try {
    ollama::setServerURL(ollama_url_);
    ollama::response response = ollama::generate(model_, prompt);
    return response.as_simple_string();
  } catch (const ollama::exception& e) {
    throw TextGenerationError("Text generation failed: " + std::string(e.what()));
  }
}

}  // namespace margin_core
