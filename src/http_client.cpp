#include "http_client.hpp"
#include "compact_log.hpp"
#include <curl/curl.h>
#include <fmt/format.h>

namespace doclint {

static size_t write_string_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* body = static_cast<std::string*>(userp);
    if (body->size() + realsize > body->max_size()) return 0;
    body->append(static_cast<char*>(contents), realsize);
    return realsize;
}

static size_t header_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* response = static_cast<HttpResponse*>(userp);
    std::string line(static_cast<char*>(contents), realsize);
    // A new status line starts the headers of a redirected response
    if (line.starts_with("HTTP/")) {
        response->headers.clear();
        return realsize;
    }
    if (auto colon = line.find(':'); colon != std::string::npos) {
        auto key = line.substr(0, colon);
        for (auto& c : key) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        auto value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        response->headers[key] = value;
    }
    return realsize;
}

class HttpClient::Impl {
public:
    std::map<std::string, std::string> headers;
    long timeout = 60;
    Impl() { curl_global_init(CURL_GLOBAL_ALL); }
    ~Impl() { curl_global_cleanup(); }
};

HttpClient::HttpClient() : pImpl_(std::make_unique<Impl>()) {}
HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

void HttpClient::set_header(std::string_view key, std::string_view value) {
    pImpl_->headers[std::string(key)] = std::string(value);
}

void HttpClient::set_timeout(long seconds) { pImpl_->timeout = seconds; }

std::expected<HttpResponse, HttpErrorInfo> HttpClient::get_full(std::string_view url_sv) {
    std::string url(url_sv);
    if (!url.starts_with("https://") && !url.starts_with("http://")) {
        return std::unexpected(HttpErrorInfo{HttpError::InvalidUrl, fmt::format("Unsupported URL: {}", url)});
    }
    CURL* curl = curl_easy_init();
    if (!curl) return std::unexpected(HttpErrorInfo{HttpError::NetworkError, "Failed to init CURL"});
    HttpResponse response;
    std::string body;
    struct curl_slist* chunk = nullptr;
    for (const auto& [k, v] : pImpl_->headers) {
        std::string h = k; h += ": "; h += v;
        chunk = curl_slist_append(chunk, h.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, chunk);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, pImpl_->timeout);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "doclint");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_string_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);
    compact::Writer::debug(fmt::format("GET {}", url));
    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(chunk);
    if (res != CURLE_OK) {
        curl_easy_cleanup(curl);
        auto kind = res == CURLE_OPERATION_TIMEDOUT ? HttpError::Timeout : HttpError::NetworkError;
        return std::unexpected(HttpErrorInfo{kind, curl_easy_strerror(res)});
    }
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);
    response.body = std::move(body);
    curl_easy_cleanup(curl);
    return response;
}

std::expected<std::string, HttpErrorInfo> HttpClient::get(std::string_view url) {
    auto res = get_full(url);
    if (!res) return std::unexpected(res.error());
    if (res->status_code >= 400) {
        return std::unexpected(HttpErrorInfo{HttpError::HttpStatusError,
            fmt::format("HTTP Error {}", res->status_code), res->status_code});
    }
    return std::move(res->body);
}

} // namespace doclint
