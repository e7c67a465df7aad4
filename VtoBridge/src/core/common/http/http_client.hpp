#pragma once

#include <string>

namespace vtob::core::common::http {

struct HttpResponse {
  bool ok = false;  // a complete HTTP response was received
  int status = 0;
  std::string body;
  std::string error;
};

// Blocking request/response seam. Implementations never throw; transport
// failures come back as ok == false with error set.
class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Post(const std::string& url, const std::string& body,
                            const std::string& content_type, int timeout_ms) = 0;
};

// One mongoose manager per request, so concurrent callers never share state.
// https URLs go through mongoose's TLS layer.
class MongooseHttpClient final : public HttpClient {
public:
  HttpResponse Post(const std::string& url, const std::string& body,
                    const std::string& content_type, int timeout_ms) override;
};

}  // namespace vtob::core::common::http
