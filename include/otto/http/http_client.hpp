#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace otto::http {

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  /// Lower-cased header names.
  HeaderMap headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool is_success() const {
    return !network_error && status >= 200 && status < 300;
  }
};

/// One form field of a multipart/form-data request. A field with `file_path` uploads the file
/// contents; otherwise `value` is sent as text.
struct MultipartField {
  std::string name;
  std::string value;
  std::optional<std::string> file_path;
  std::optional<std::string> filename;
  std::optional<std::string> content_type;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HeaderMap &headers,
                                         std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_multipart(const std::string &url,
                                                    const HeaderMap &headers,
                                                    const std::vector<MultipartField> &fields,
                                                    std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse get(const std::string &url, const HeaderMap &headers,
                                 std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_multipart(const std::string &url, const HeaderMap &headers,
                                            const std::vector<MultipartField> &fields,
                                            std::uint64_t timeout_ms) override;
};

/// Short human-readable description of a failed response, for logs and error statuses.
[[nodiscard]] std::string describe_failure(const HttpResponse &response);

} // namespace otto::http
