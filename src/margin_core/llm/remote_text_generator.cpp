#include "margin_core/llm/remote_text_generator.hpp"

#include <utility>

namespace margin_core {

RemoteTextGenerator::RemoteTextGenerator(std::shared_ptr<RemoteApiClient> api_client,
                                         const std::string& model)
    : api_client_(std::move(api_client)), model_(model) {}

std::string RemoteTextGenerator::generate_text(const std::string& prompt) {
  nlohmann::json part = {{"text", prompt}};
  nlohmann::json turn = {{"role", "user"}, {"parts", nlohmann::json::array({part})}};
  nlohmann::json body = {{"contents", nlohmann::json::array({turn})}};

  nlohmann::json response;
  try {
    response = api_client_->post("models/" + model_ + ":generateContent", body);
  } catch (const RemoteApiError& e) {
    throw TextGenerationError("Remote generation failed: " + std::string(e.what()));
  }

  try {
    const auto& candidates = response.at("candidates");
    if (!candidates.is_array() || candidates.empty()) {
      throw TextGenerationError("Remote generation returned no candidates");
    }
    std::string text;
    for (const auto& p : candidates[0].at("content").at("parts")) {
      text += p.value("text", std::string());
    }
    return text;
  } catch (const nlohmann::json::exception& e) {
    throw TextGenerationError("Malformed generation response: " + std::string(e.what()));
  }
}

}  // namespace margin_core
