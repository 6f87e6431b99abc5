#pragma once

#include <memory>
#include <string>

#include "margin_core/llm/text_generator.hpp"
#include "margin_core/net/remote_api_client.hpp"

namespace margin_core {

// Gemini generateContent. The prompt is sent as a single user turn and the
// text parts of the first candidate are concatenated.
class RemoteTextGenerator : public TextGenerator {
 public:
  RemoteTextGenerator(std::shared_ptr<RemoteApiClient> api_client, const std::string& model);

  std::string generate_text(const std::string& prompt) override;

 private:
  std::shared_ptr<RemoteApiClient> api_client_;
  std::string model_;
};

}  // namespace margin_core
