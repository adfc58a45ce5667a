#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace watchllm::transport {

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  /// Keys are lower-cased.
  HeaderMap headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool success() const {
    return !timeout && !network_error && status >= 200 && status < 300;
  }
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HeaderMap &headers,
                                         std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse get(const std::string &url, const HeaderMap &headers,
                                 std::uint64_t timeout_ms) override;
};

} // namespace watchllm::transport
