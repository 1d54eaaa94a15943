#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace platform {

enum class HttpMethod { kGet = 0, kPost, kDelete, kOptions };

struct HttpRequest {
  std::string path;
  std::string body;
  std::string remote_addr;
  std::map<std::string, std::string> query_params;
  std::map<std::string, std::string> headers;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::map<std::string, std::string> headers;
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

// Case-insensitive header lookup; returns an empty string when absent.
std::string HeaderValue(const HttpRequest& request, const std::string& name);

class HttpServer {
 public:
  HttpServer();
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  void AddHandler(HttpMethod method, const std::string& path, HttpHandler handler);
  void Start(const std::string& host, int port);
  void Stop();

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace platform
