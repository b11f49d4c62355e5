#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>

namespace {
size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* s = static_cast<std::string*>(userdata);
  s->append(ptr, size * nmemb);
  return size * nmemb;
}
}

class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }
  ~CurlHttpClient() override {
    curl_global_cleanup();
  }
  HttpResponse Get(const std::string& url,
                   const std::unordered_map<std::string, std::string>& headers,
                   int timeout_ms) override {
    return Perform(url, nullptr, headers, timeout_ms);
  }
  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    return Perform(url, &body, headers, timeout_ms);
  }
private:
  HttpResponse Perform(const std::string& url,
                       const std::string* body,
                       const std::unordered_map<std::string, std::string>& headers,
                       int timeout_ms) {
    HttpResponse resp;
    CURL* curl = curl_easy_init();
    if (!curl) {
      Logger::Error("curl_easy_init failed");
      resp.error = "curl_easy_init failed";
      return resp;
    }
    std::string response_string;
    struct curl_slist* header_list = nullptr;
    for (const auto& kv : headers) {
      std::string line = kv.first + ": " + kv.second;
      header_list = curl_slist_append(header_list, line.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (body) {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->data());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    } else {
      curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
      resp.error = curl_easy_strerror(rc);
      Logger::Error(std::string(body ? "POST " : "GET ") + url + " failed: " + resp.error);
    } else {
      long code = 0;
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
      resp.status = code;
      resp.body = std::move(response_string);
      Logger::Debug(std::string(body ? "POST " : "GET ") + url + " -> " + std::to_string(code));
    }
    if (header_list) curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return resp;
  }
};

HttpClient* CreateCurlHttpClient() {
  return new CurlHttpClient();
}
