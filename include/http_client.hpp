#pragma once

#include <string>
#include <string_view>
#include <map>
#include <memory>
#include <expected>

namespace doclint {

enum class HttpError {
    NetworkError,
    InvalidUrl,
    HttpStatusError,
    Timeout
};

struct HttpErrorInfo {
    HttpError error;
    std::string message;
    int status_code = 0;
};

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;  // keys lower-cased, final response only
    std::string body;
};

class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    // GET request returning response body; status >= 400 is an error
    std::expected<std::string, HttpErrorInfo> get(std::string_view url);

    // GET request returning status, headers and body as received
    std::expected<HttpResponse, HttpErrorInfo> get_full(std::string_view url);

    void set_header(std::string_view key, std::string_view value);

    // Whole-transfer timeout in seconds
    void set_timeout(long seconds);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace doclint
