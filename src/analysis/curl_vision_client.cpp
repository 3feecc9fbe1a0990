#include <sitescan/analysis/curl_vision_client.hpp>
#include <sitescan/core/logging.hpp>
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <string>

namespace sitescan::analysis {

namespace {

std::once_flag g_curl_init;

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
  const size_t total = size * nmemb;
  static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), total);
  return total;
}

struct CurlHandleDeleter {
  void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

TransportError classify(CURLcode code) {
  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
      return TransportError::Timeout;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
      return TransportError::ConnectionFailed;
    default:
      return TransportError::Other;
  }
}

}  // namespace

CurlVisionClient::CurlVisionClient() {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlVisionClient::~CurlVisionClient() = default;

std::expected<VisionResponse, TransportError> CurlVisionClient::post(const VisionRequest& request) {
  std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
  if (!curl) {
    return std::unexpected(TransportError::Other);
  }

  curl_slist* raw_headers = nullptr;
  raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
  raw_headers = curl_slist_append(raw_headers, ("Authorization: Bearer " + request.api_key).c_str());
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  VisionResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, request.endpoint.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    sitescan::core::get_logger("backend.remote")
        .warn("request failed", {{"endpoint", request.endpoint}, {"curl", curl_easy_strerror(res)}});
    return std::unexpected(classify(res));
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

}  // namespace sitescan::analysis
