#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace httplib {
class Client;
class Result;
}

namespace feishu_auth
{

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char l, unsigned char r) { return std::tolower(l) < std::tolower(r); });
    }
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

// Network-level failure raised by transports: connection refused, timeout,
// TLS failure. HTTP status codes are never reported through this exception.
class HttpException : public std::runtime_error {
public:
    explicit HttpException(const std::string& msg) : std::runtime_error(msg) {}
};

// ----------------------------------------------------------------------

class HttpUrl {
public:
    HttpUrl(const std::string& url);
    void ParseUrl(const std::string& url);
    std::string ToSchemeHostAndPort() const;
    std::string ToPathQuery() const;
    std::string ToString() const;
    operator std::string() const;

    std::string Scheme() const;
    std::string Host() const;
    std::string Port() const;
    std::string Path() const;
    std::string Query() const;
    std::string Fragment() const;

    // Appends an already encoded key=value pair to the query string
    HttpUrl& AppendQueryParameter(const std::string& encoded_key, const std::string& encoded_value);

private:
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

// ----------------------------------------------------------------------

struct HttpParams {

    static constexpr uint64_t DEFAULT_TIMEOUT = 30000; // 30 sec
    static constexpr uint64_t DEFAULT_RETRIES = 3;
    static constexpr uint64_t DEFAULT_RETRY_WAIT_MS = 100;
    static constexpr float DEFAULT_RETRY_BACKOFF = 4;
    static constexpr bool DEFAULT_KEEP_ALIVE = true;

    HttpParams();

    uint64_t timeout;
    uint64_t retries;
    uint64_t retry_wait_ms;
    float retry_backoff;
    bool keep_alive;
};

// ----------------------------------------------------------------------

class HttpMethod
{
public:
    enum Variants : uint8_t
    {
        UNDEFINED,
        GET,
        POST
    };

    HttpMethod() = default;
    constexpr HttpMethod(Variants ret_type) : variant(ret_type) { }
    constexpr bool operator==(HttpMethod a) const { return variant == a.variant; }
    constexpr bool operator!=(HttpMethod a) const { return variant != a.variant; }

    constexpr bool IsUndefined() const { return variant == UNDEFINED; }

    std::string ToString() const;

private:
    Variants variant = UNDEFINED;
};

// ----------------------------------------------------------------------

class HttpRequest
{
public:
    HttpRequest(HttpMethod method, const std::string &url, std::string content_type, std::string content);
    HttpRequest(HttpMethod method, const std::string &url);

    void BearerAuth(const std::string &access_token);

public:
    HttpMethod method;
    HttpUrl url;

    HeaderMap headers;
    std::string content_type;
    std::string content;
};

// ----------------------------------------------------------------------

class HttpResponse
{
public:
    HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content);
    HttpResponse(HttpMethod method, HttpUrl url, int code);

    int Code() const;
    bool IsSuccess() const;
    std::string Content() const;

public:
    HttpMethod method;
    HttpUrl url;

    int code;
    HeaderMap headers;
    std::string content_type;
    std::string content;
};

// ----------------------------------------------------------------------

// Injected transport. Implementations return any HTTP response (including
// non-2xx) and throw HttpException on network-level failure.
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;
    virtual std::unique_ptr<HttpResponse> SendRequest(HttpRequest &request) = 0;
};

// cpp-httplib backed transport with retry and exponential backoff for
// transient statuses and network errors
class HttpClient : public HttpTransport
{
public:
    HttpClient();
    explicit HttpClient(const HttpParams &http_params);

    std::unique_ptr<HttpResponse> SendRequest(HttpRequest &request) override;

    const HttpParams &Params() const { return http_params; }

    static bool IsRetryableStatus(int status);
    uint64_t CalculateSleepTime(uint64_t n_tries) const;

private:
    HttpParams http_params;

    std::unique_ptr<httplib::Client> CreateHttplibClient(const std::string &scheme_host_and_port) const;
    httplib::Result Execute(httplib::Client &client, HttpRequest &request) const;
};

} // namespace feishu_auth
