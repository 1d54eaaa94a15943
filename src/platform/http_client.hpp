#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace httplib {
class Response;
}

namespace platform {

struct HttpClientResponse {
  int status = 0;
  std::string content_type;
  std::string body;
  std::map<std::string, std::string> headers;
};

// Raised when no HTTP response was received (refused, timed out, TLS failure).
class HttpTransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class HttpClient {
 public:
  HttpClient(std::string base_url, int timeout_seconds);

  HttpClientResponse Get(const std::string& path,
                         const std::map<std::string, std::string>& query = {}) const;
  HttpClientResponse Post(const std::string& path, const std::string& body,
                          const std::map<std::string, std::string>& headers = {},
                          const std::string& content_type = "application/json") const;
  HttpClientResponse Delete(const std::string& path,
                            const std::map<std::string, std::string>& headers = {}) const;


 private:
  std::string BuildTarget(const std::string& path,
                          const std::map<std::string, std::string>& query) const;
  HttpClientResponse ConvertResponse(const httplib::Response& response) const;
  [[noreturn]] void Raise(const std::string& target, const std::string& reason) const;

  std::string scheme_host_port_;
  std::string path_prefix_;
  int timeout_seconds_;
};

}  // namespace platform
