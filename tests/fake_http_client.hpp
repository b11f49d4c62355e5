#pragma once
#include "net/http_client.hpp"
#include <map>
#include <string>
#include <vector>

// Scripted HttpClient: responses are keyed by "GET <url>" / "POST <url>" and
// every request is recorded for inspection.
class FakeHttpClient : public HttpClient {
public:
  struct Request {
    std::string method;
    std::string url;
    std::string body;
    std::unordered_map<std::string, std::string> headers;
  };

  void OnGet(const std::string& url, long status, const std::string& body) {
    responses_["GET " + url] = HttpResponse{status, body, ""};
  }
  void OnPost(const std::string& url, long status, const std::string& body) {
    responses_["POST " + url] = HttpResponse{status, body, ""};
  }
  void FailPost(const std::string& url, const std::string& error) {
    responses_["POST " + url] = HttpResponse{0, "", error};
  }

  HttpResponse Get(const std::string& url,
                   const std::unordered_map<std::string, std::string>& headers,
                   int) override {
    return Respond("GET", url, "", headers);
  }
  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int) override {
    return Respond("POST", url, body, headers);
  }

  std::vector<Request> requests;

private:
  std::map<std::string, HttpResponse> responses_;

  HttpResponse Respond(const std::string& method, const std::string& url, const std::string& body,
                       const std::unordered_map<std::string, std::string>& headers) {
    requests.push_back(Request{method, url, body, headers});
    auto it = responses_.find(method + " " + url);
    if (it == responses_.end()) return HttpResponse{0, "", "no route to " + url};
    return it->second;
  }
};
