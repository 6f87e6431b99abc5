#pragma once

#include <string>
#include <vector>

namespace margin_core {

class HttpError : public std::exception {
 public:
  HttpError(const std::string& message, bool timed_out)
      : message_(message), timed_out_(timed_out) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }
  bool timed_out() const {
    return timed_out_;
  }

 private:
  std::string message_;
  bool timed_out_;
};

struct HttpResponse {
  long status_code = 0;
  std::string body;
};

// Minimal blocking HTTP client over libcurl. Each request uses its own easy
// handle, so one client may be shared across threads.
class HttpClient {
 public:
  HttpClient();
  virtual ~HttpClient() = default;

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // Throws HttpError on transport failure. Non-2xx statuses are returned, not thrown.
  virtual HttpResponse post_json(const std::string& url,
                                 const std::string& body,
                                 const std::vector<std::string>& headers,
                                 long timeout_seconds);

 private:
  static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
};

}  // namespace margin_core
