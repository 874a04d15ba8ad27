#pragma once

#include <string>
#include <vector>

namespace finrag {

struct HttpRequest {
  std::string url;
  std::vector<std::string> headers;
  std::string body;
  long timeout_ms = 30000;
};

struct HttpResponse {
  long status = 0;
  std::string body;
};

class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  // Throws std::runtime_error when no response was received. Non-2xx
  // statuses are returned, not thrown.
  virtual HttpResponse PostJson(const HttpRequest &request) = 0;
};

// One easy handle per request, so a single instance can serve every thread.
class CurlTransport : public HttpTransport {
public:
  CurlTransport();

  HttpResponse PostJson(const HttpRequest &request) override;
};

} // namespace finrag
