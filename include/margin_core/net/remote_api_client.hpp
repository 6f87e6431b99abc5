#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "margin_core/net/http_client.hpp"
#include "margin_core/net/retry.hpp"

namespace margin_core {

// Non-retryable failure reported by the remote API (bad request, auth, malformed body).
class RemoteApiError : public std::exception {
 public:
  RemoteApiError(const std::string& message, long status_code)
      : message_(message), status_code_(status_code) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }
  long status_code() const {
    return status_code_;
  }

 private:
  std::string message_;
  long status_code_;
};

struct RemoteApiOptions {
  std::string endpoint;
  std::string api_key;
  long timeout_seconds = 30;
  RetryPolicy retry;
};

// JSON-over-HTTPS client for the Gemini-compatible API shared by remote
// embeddings and remote text generation.
class RemoteApiClient {
 public:
  RemoteApiClient(std::shared_ptr<HttpClient> http_client,
                  RemoteApiOptions options,
                  Sleeper sleeper = sleep_for);

  bool has_credentials() const {
    return !options_.api_key.empty();
  }

  // POSTs body to <endpoint>/<path>. Retries 429/503 and timeouts.
  // Throws ConfigurationError without credentials, TransientProviderError once
  // retries are exhausted and RemoteApiError for anything else.
  nlohmann::json post(const std::string& path, const nlohmann::json& body);

 private:
  nlohmann::json post_once(const std::string& url, const std::string& payload);

  std::shared_ptr<HttpClient> http_client_;
  RemoteApiOptions options_;
  Sleeper sleeper_;
};

}  // namespace margin_core
