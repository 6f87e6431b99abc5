#include "margin_core/net/remote_api_client.hpp"

#include <utility>

#include "margin_core/config/settings.hpp"

namespace margin_core {

RemoteApiClient::RemoteApiClient(std::shared_ptr<HttpClient> http_client,
                                 RemoteApiOptions options,
                                 Sleeper sleeper)
    : http_client_(std::move(http_client)), options_(std::move(options)), sleeper_(std::move(sleeper)) {}

nlohmann::json RemoteApiClient::post(const std::string& path, const nlohmann::json& body) {
  if (!has_credentials()) {
    throw ConfigurationError("Remote API key is not configured");
  }

  std::string url = options_.endpoint;
  if (!url.empty() && url.back() != '/') {
    url += '/';
  }
  url += path;
  const std::string payload = body.dump();

  return with_retry(options_.retry, sleeper_, [&]() { return post_once(url, payload); });
}

nlohmann::json RemoteApiClient::post_once(const std::string& url, const std::string& payload) {
  HttpResponse response;
  try {
    response = http_client_->post_json(url, payload, {"x-goog-api-key: " + options_.api_key},
                                       options_.timeout_seconds);
  } catch (const HttpError& e) {
    if (e.timed_out()) {
      throw TransientProviderError(std::string("Request timed out: ") + e.what());
    }
    throw RemoteApiError(e.what(), 0);
  }

  if (response.status_code == 429 || response.status_code == 503) {
    throw TransientProviderError("Rate limited (HTTP " + std::to_string(response.status_code) + ")");
  }

  nlohmann::json parsed = nlohmann::json::parse(response.body, nullptr, false);

  if (response.status_code < 200 || response.status_code >= 300) {
    std::string detail = response.body;
    if (!parsed.is_discarded() && parsed.contains("error") && parsed["error"].is_object()) {
      detail = parsed["error"].value("message", detail);
      // Some gateways report quota exhaustion with a non-429 status
      if (parsed["error"].value("status", std::string()) == "RESOURCE_EXHAUSTED") {
        throw TransientProviderError("Rate limited: " + detail);
      }
    }
    throw RemoteApiError("HTTP " + std::to_string(response.status_code) + ": " + detail,
                         response.status_code);
  }

  if (parsed.is_discarded()) {
    throw RemoteApiError("Response body is not valid JSON", response.status_code);
  }
  return parsed;
}

}  // namespace margin_core
