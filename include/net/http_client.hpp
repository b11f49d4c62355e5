#pragma once
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;     // 0 when the request never completed
  std::string body;
  std::string error;   // transport error text when status == 0
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Get(const std::string& url,
                           const std::unordered_map<std::string, std::string>& headers,
                           int timeout_ms) = 0;
  // body is sent verbatim and may hold binary data
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

// Factory for a libcurl-based client; caller owns the result.
HttpClient* CreateCurlHttpClient();
