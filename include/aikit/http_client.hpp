#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "aikit/cancellation.hpp"

namespace aikit {

struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{60000};
  CancellationToken cancellation;
};

struct HttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
};

class HttpStream {
public:
  virtual ~HttpStream() = default;

  virtual long status_code() const = 0;
  virtual const std::map<std::string, std::string>& headers() const = 0;

  virtual std::optional<std::string> read(const CancellationToken& cancellation) = 0;

  virtual void close() = 0;
  virtual bool closed() const = 0;

  std::string read_all(const CancellationToken& cancellation) {
    std::string body;
    while (auto chunk = read(cancellation)) {
      body += *chunk;
    }
    return body;
  }
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResponse request(const HttpRequest& request) = 0;

  virtual std::unique_ptr<HttpStream> open_stream(const HttpRequest& request) = 0;
};

std::unique_ptr<HttpClient> make_default_http_client();

std::optional<std::string> find_header(const std::map<std::string, std::string>& headers, std::string_view name);

}  // namespace aikit
