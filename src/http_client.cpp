#include "aikit/http_client.hpp"

#include "aikit/error.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace aikit {
namespace {

constexpr int kPollIntervalMs = 100;
constexpr const char* kUserAgent = "aikit/0.1";

struct CurlEasyDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlMultiDeleter {
  void operator()(CURLM* handle) const { curl_multi_cleanup(handle); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlMultiPtr = std::unique_ptr<CURLM, CurlMultiDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct ResponseState {
  long status = 0;
  std::map<std::string, std::string> headers;
  bool headers_complete = false;
  std::string body;
  const CancellationToken* cancellation = nullptr;
};

std::string trim(const std::string& value) {
  auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
  auto begin = std::find_if(value.begin(), value.end(), not_space);
  auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
  return begin < end ? std::string(begin, end) : std::string();
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* state = static_cast<ResponseState*>(userdata);
  const size_t total = size * nmemb;
  state->body.append(ptr, total);
  return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* state = static_cast<ResponseState*>(userdata);
  const size_t total = size * nitems;
  const std::string line = trim(std::string(buffer, total));

  if (line.empty()) {
    // Interim responses (100 Continue) and followed redirects precede another status line.
    const bool redirect = state->status >= 300 && state->status < 400 &&
                          find_header(state->headers, "location").has_value();
    if (state->status >= 200 && !redirect) {
      state->headers_complete = true;
    }
    return total;
  }

  if (line.rfind("HTTP/", 0) == 0) {
    state->headers.clear();
    state->headers_complete = false;
    auto space = line.find(' ');
    state->status = space == std::string::npos ? 0 : std::strtol(line.c_str() + space + 1, nullptr, 10);
    return total;
  }

  auto colon_pos = line.find(':');
  if (colon_pos != std::string::npos) {
    std::string key = trim(line.substr(0, colon_pos));
    if (!key.empty()) {
      state->headers[key] = trim(line.substr(colon_pos + 1));
    }
  }
  return total;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto* state = static_cast<ResponseState*>(userdata);
  return state->cancellation && state->cancellation->is_cancelled() ? 1 : 0;
}

TransportError::Kind failure_kind(CURLcode code) {
  switch (code) {
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
      return TransportError::Kind::InvalidURL;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
      return TransportError::Kind::Unreachable;
    case CURLE_OPERATION_TIMEDOUT:
      return TransportError::Kind::Timeout;
    case CURLE_ABORTED_BY_CALLBACK:
      return TransportError::Kind::Cancelled;
    default:
      return TransportError::Kind::ConnectionLost;
  }
}

[[noreturn]] void throw_curl_error(CURLcode code) {
  throw TransportError(failure_kind(code), std::string("libcurl error: ") + curl_easy_strerror(code));
}

CurlSlistPtr build_header_list(const HttpRequest& request) {
  curl_slist* list = nullptr;
  for (const auto& [key, value] : request.headers) {
    std::string header = key + ": " + value;
    curl_slist* appended = curl_slist_append(list, header.c_str());
    if (!appended) {
      curl_slist_free_all(list);
      throw Error("Failed to allocate request headers");
    }
    list = appended;
  }
  return CurlSlistPtr(list);
}

CurlEasyPtr make_easy(const HttpRequest& request, const std::string& body, curl_slist* headers, ResponseState& state) {
  CurlEasyPtr curl(curl_easy_init());
  if (!curl) {
    throw Error("Failed to initialize libcurl");
  }
  CURL* handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(handle, CURLOPT_HEADERDATA, &state);
  curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &state);
  curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle, CURLOPT_USERAGENT, kUserAgent);
  if (!body.empty()) {
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  }
  return curl;
}

/**
 * Pull-based response body over the multi interface. Each read drives the transfer
 * until bytes arrive, polling in short slices so cancellation is observed promptly.
 */
class CurlHttpStream final : public HttpStream {
public:
  explicit CurlHttpStream(const HttpRequest& request)
      : body_(request.body), headers_list_(build_header_list(request)) {
    state_.cancellation = &request.cancellation;
    easy_ = make_easy(request, body_, headers_list_.get(), state_);
    // Streams may legitimately run far longer than the request timeout; only stalls count.
    const long timeout_ms = static_cast<long>(request.timeout.count());
    curl_easy_setopt(easy_.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(easy_.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(easy_.get(), CURLOPT_LOW_SPEED_TIME, std::max(1L, timeout_ms / 1000));

    multi_.reset(curl_multi_init());
    if (!multi_) {
      throw Error("Failed to initialize libcurl multi handle");
    }
    if (curl_multi_add_handle(multi_.get(), easy_.get()) != CURLM_OK) {
      throw Error("Failed to attach request to libcurl multi handle");
    }
    attached_ = true;

    pump_until(request.cancellation, [this] { return state_.headers_complete; });
    if (!state_.headers_complete) {
      const CURLcode result = result_;
      close();
      throw_curl_error(result == CURLE_OK ? CURLE_GOT_NOTHING : result);
    }
    // The token is only borrowed for the handshake; reads supply their own.
    state_.cancellation = nullptr;
  }

  ~CurlHttpStream() override { close(); }

  long status_code() const override { return state_.status; }
  const std::map<std::string, std::string>& headers() const override { return state_.headers; }

  std::optional<std::string> read(const CancellationToken& cancellation) override {
    if (closed_ && state_.body.empty()) {
      return std::nullopt;
    }
    if (!closed_) {
      pump_until(cancellation, [this] { return !state_.body.empty(); });
    }
    if (!state_.body.empty()) {
      std::string chunk;
      chunk.swap(state_.body);
      return chunk;
    }
    const CURLcode result = result_;
    close();
    if (result != CURLE_OK) {
      throw_curl_error(result);
    }
    return std::nullopt;
  }

  void close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    if (attached_) {
      curl_multi_remove_handle(multi_.get(), easy_.get());
      attached_ = false;
    }
    easy_.reset();
    multi_.reset();
    headers_list_.reset();
  }

  bool closed() const override { return closed_; }

private:
  void pump_until(const CancellationToken& cancellation, const std::function<bool()>& ready) {
    while (!ready() && !finished_) {
      if (cancellation.is_cancelled()) {
        close();
        throw TransportError(TransportError::Kind::Cancelled, "stream read cancelled");
      }
      int running = 0;
      CURLMcode code = curl_multi_perform(multi_.get(), &running);
      if (code != CURLM_OK) {
        close();
        throw TransportError(TransportError::Kind::ConnectionLost,
                             std::string("libcurl multi error: ") + curl_multi_strerror(code));
      }
      int queued = 0;
      while (CURLMsg* message = curl_multi_info_read(multi_.get(), &queued)) {
        if (message->msg == CURLMSG_DONE) {
          finished_ = true;
          result_ = message->data.result;
        }
      }
      if (!ready() && !finished_) {
        code = curl_multi_poll(multi_.get(), nullptr, 0, kPollIntervalMs, nullptr);
        if (code != CURLM_OK) {
          close();
          throw TransportError(TransportError::Kind::ConnectionLost,
                               std::string("libcurl multi error: ") + curl_multi_strerror(code));
        }
      }
    }
  }

  std::string body_;
  CurlSlistPtr headers_list_;
  ResponseState state_;
  CurlEasyPtr easy_;
  CurlMultiPtr multi_;
  bool attached_ = false;
  bool finished_ = false;
  bool closed_ = false;
  CURLcode result_ = CURLE_OK;
};

class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient() = default;

  HttpResponse request(const HttpRequest& request) override {
    auto header_list = build_header_list(request);
    ResponseState state;
    state.cancellation = &request.cancellation;
    auto curl = make_easy(request, request.body, header_list.get(), state);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
      throw_curl_error(res);
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    return HttpResponse{status_code, std::move(state.headers), std::move(state.body)};
  }

  std::unique_ptr<HttpStream> open_stream(const HttpRequest& request) override {
    return std::make_unique<CurlHttpStream>(request);
  }
};

struct CurlGlobalState {
  CurlGlobalState() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobalState() { curl_global_cleanup(); }
};

CurlGlobalState& curl_state() {
  static CurlGlobalState state;
  return state;
}

}  // namespace

std::unique_ptr<HttpClient> make_default_http_client() {
  (void)curl_state();
  return std::make_unique<CurlHttpClient>();
}

std::optional<std::string> find_header(const std::map<std::string, std::string>& headers, std::string_view name) {
  for (const auto& [key, value] : headers) {
    const bool same = key.size() == name.size() &&
                      std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
                        return std::tolower(static_cast<unsigned char>(a)) ==
                               std::tolower(static_cast<unsigned char>(b));
                      });
    if (same) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace aikit
