#include "margin_core/net/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace margin_core {

namespace {

std::once_flag curl_init_flag;

struct CurlListDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

}  // namespace

HttpClient::HttpClient() {
  std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
  userp->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

HttpResponse HttpClient::post_json(const std::string& url,
                                   const std::string& body,
                                   const std::vector<std::string>& headers,
                                   long timeout_seconds) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw HttpError("Failed to initialize CURL", false);
  }

  curl_slist* raw_list = curl_slist_append(nullptr, "Content-Type: application/json");
  for (const auto& header : headers) {
    raw_list = curl_slist_append(raw_list, header.c_str());
  }
  std::unique_ptr<curl_slist, CurlListDeleter> header_list(raw_list);

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw HttpError("CURL request failed: " + std::string(curl_easy_strerror(res)),
                    res == CURLE_OPERATION_TIMEDOUT);
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

}  // namespace margin_core
