#include "platform/http_client.hpp"

#include <cctype>
#include <string>
#include <utility>

#include "httplib.h"

namespace {

std::string Trim(const std::string& value) {
  std::size_t first = 0;
  std::size_t last = value.size();
  while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) {
    ++first;
  }
  while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) {
    --last;
  }
  return value.substr(first, last - first);
}

struct ParsedUrl {
  std::string scheme;
  std::string authority;
  std::string path;
};

ParsedUrl ParseUrl(const std::string& base_url) {
  const auto scheme_end = base_url.find("://");
  if (scheme_end == std::string::npos) {
    throw std::invalid_argument("URL must include a scheme (e.g., https://api.open-meteo.com): " +
                                base_url);
  }

  ParsedUrl parsed;
  parsed.scheme = base_url.substr(0, scheme_end);
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw std::invalid_argument("Unsupported URL scheme: " + parsed.scheme);
  }

  const auto remainder = base_url.substr(scheme_end + 3);
  const auto slash_pos = remainder.find('/');
  parsed.authority = remainder.substr(0, slash_pos);
  if (slash_pos != std::string::npos) {
    parsed.path = remainder.substr(slash_pos);
    while (!parsed.path.empty() && parsed.path.back() == '/') {
      parsed.path.pop_back();
    }
  }
  if (parsed.authority.empty()) {
    throw std::invalid_argument("URL has no host: " + base_url);
  }

  const auto colon_pos = parsed.authority.rfind(':');
  if (colon_pos != std::string::npos) {
    const auto port_str = parsed.authority.substr(colon_pos + 1);
    int port = 0;
    try {
      port = std::stoi(port_str);
    } catch (const std::exception&) {
      throw std::invalid_argument("Port in URL is not a number: " + base_url);
    }
    if (port <= 0 || port > 65535) {
      throw std::invalid_argument("Port extracted from URL is invalid: " + base_url);
    }
  }
  return parsed;
}

std::string UrlEncode(const std::string& value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string encoded;
  for (unsigned char ch : value) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
        ch == '-' || ch == '_' || ch == '.' || ch == '~' || ch == ',') {
      encoded.push_back(static_cast<char>(ch));
    } else {
      encoded.push_back('%');
      encoded.push_back(kHex[(ch >> 4) & 0x0F]);
      encoded.push_back(kHex[ch & 0x0F]);
    }
  }
  return encoded;
}

httplib::Headers ToHeaders(const std::map<std::string, std::string>& headers) {
  httplib::Headers converted;
  for (const auto& [key, value] : headers) {
    converted.emplace(key, value);
  }
  return converted;
}

}  // namespace

namespace platform {

HttpClient::HttpClient(std::string base_url, int timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
  auto parsed = ParseUrl(base_url);
  scheme_host_port_ = parsed.scheme + "://" + parsed.authority;
  path_prefix_ = std::move(parsed.path);
  if (timeout_seconds_ <= 0) {
    throw std::invalid_argument("HTTP client timeout must be positive");
  }
}

HttpClientResponse HttpClient::Get(const std::string& path,
                                   const std::map<std::string, std::string>& query) const {
  const auto target = BuildTarget(path, query);
  try {
    httplib::Client client(scheme_host_port_);
    client.set_connection_timeout(timeout_seconds_);
    client.set_read_timeout(timeout_seconds_);
    client.set_write_timeout(timeout_seconds_);

    auto response = client.Get(target);
    if (!response) {
      Raise(target, httplib::to_string(response.error()));
    }
    return ConvertResponse(*response);
  } catch (const std::invalid_argument& ex) {
    // httplib rejects https:// when built without TLS support.
    Raise(target, ex.what());
  }
}

HttpClientResponse HttpClient::Post(const std::string& path, const std::string& body,
                                    const std::map<std::string, std::string>& headers,
                                    const std::string& content_type) const {
  const auto target = BuildTarget(path, {});
  try {
    httplib::Client client(scheme_host_port_);
    client.set_connection_timeout(timeout_seconds_);
    client.set_read_timeout(timeout_seconds_);
    client.set_write_timeout(timeout_seconds_);

    auto response = client.Post(target, ToHeaders(headers), body, content_type);
    if (!response) {
      Raise(target, httplib::to_string(response.error()));
    }
    return ConvertResponse(*response);
  } catch (const std::invalid_argument& ex) {
    Raise(target, ex.what());
  }
}

HttpClientResponse HttpClient::Delete(const std::string& path,
                                      const std::map<std::string, std::string>& headers) const {
  const auto target = BuildTarget(path, {});
  try {
    httplib::Client client(scheme_host_port_);
    client.set_connection_timeout(timeout_seconds_);
    client.set_read_timeout(timeout_seconds_);
    client.set_write_timeout(timeout_seconds_);

    auto response = client.Delete(target, ToHeaders(headers));
    if (!response) {
      Raise(target, httplib::to_string(response.error()));
    }
    return ConvertResponse(*response);
  } catch (const std::invalid_argument& ex) {
    Raise(target, ex.what());
  }
}

std::string HttpClient::BuildTarget(const std::string& path,
                                    const std::map<std::string, std::string>& query) const {
  std::string target = path_prefix_ + path;
  if (query.empty()) {
    return target;
  }

  target.push_back('?');
  bool first = true;
  for (const auto& [key, value] : query) {
    if (!first) {
      target.push_back('&');
    }
    target += UrlEncode(key);
    target.push_back('=');
    target += UrlEncode(value);
    first = false;
  }
  return target;
}

HttpClientResponse HttpClient::ConvertResponse(const httplib::Response& result) const {
  HttpClientResponse response;
  response.status = result.status;
  response.content_type = Trim(result.get_header_value("Content-Type"));
  response.body = result.body;
  for (const auto& header : result.headers) {
    response.headers[header.first] = header.second;
  }
  return response;
}

[[noreturn]] void HttpClient::Raise(const std::string& target, const std::string& reason) const {
  throw HttpTransportError("HTTP request to " + scheme_host_port_ + target + " failed: " + reason);
}

}  // namespace platform
