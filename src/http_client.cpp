#include <finrag/http_client.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>

namespace {

std::size_t AppendBody(char *contents, std::size_t size, std::size_t count,
                       void *user_data) {
  const auto total = size * count;
  static_cast<std::string *>(user_data)->append(contents, total);
  return total;
}

struct EasyHandleDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
  void operator()(curl_slist *headers) const { curl_slist_free_all(headers); }
};

void InitializeCurlOnce() {
  static std::once_flag initialized;
  std::call_once(initialized, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

} // namespace

namespace finrag {

CurlTransport::CurlTransport() { InitializeCurlOnce(); }

HttpResponse CurlTransport::PostJson(const HttpRequest &request) {
  std::unique_ptr<CURL, EasyHandleDeleter> handle(curl_easy_init());
  if (!handle) {
    throw std::runtime_error("curl_easy_init failed");
  }

  curl_slist *raw_headers =
      curl_slist_append(nullptr, "Content-Type: application/json");
  for (const auto &header : request.headers) {
    raw_headers = curl_slist_append(raw_headers, header.c_str());
  }
  std::unique_ptr<curl_slist, HeaderListDeleter> headers(raw_headers);

  std::string body;
  curl_easy_setopt(handle.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, request.body.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(request.body.size()));
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, AppendBody);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, request.timeout_ms);
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

  const auto code = curl_easy_perform(handle.get());
  if (code != CURLE_OK) {
    throw std::runtime_error("HTTP request to " + request.url +
                             " failed: " + curl_easy_strerror(code));
  }
  HttpResponse response;
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
  response.body = std::move(body);
  return response;
}

} // namespace finrag
