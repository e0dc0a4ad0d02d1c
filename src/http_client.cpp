#include <algorithm>
#include <cmath>
#include <regex>
#include <sstream>
#include <thread>

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#include "http_client.hpp"
#include "feishu_tracing.hpp"

namespace feishu_auth
{

HttpUrl::HttpUrl(const std::string& url) {
    ParseUrl(url);
}

void HttpUrl::ParseUrl(const std::string& url) {
    const static std::regex re(R"(^(?:(https?):)?(?://(?:[^:/?#@]*(?::[^@/?#]*)?@)?([^:/?#]+)(?::(\d+))?)?([^?#]*)(\?[^#]*)?(#.*)?)");
    std::smatch m;
    if (!std::regex_match(url, m, re)) {
        throw std::invalid_argument("Invalid URL, cannot be parsed: " + url);
    }

    scheme = m[1].str();
    host = m[2].str();
    port = m[3].str();
    path = m[4].str();
    query = m[5].str();
    fragment = m[6].str();
}

std::string HttpUrl::ToSchemeHostAndPort() const {
    std::ostringstream ss;
    ss << scheme << "://" << host;
    if (!port.empty()) {
        ss << ":" << port;
    }
    return ss.str();
}

std::string HttpUrl::ToPathQuery() const {
    std::ostringstream ss;
    ss << (path.empty() ? "/" : path) << query;
    return ss.str();
}

std::string HttpUrl::ToString() const {
    std::ostringstream ss;
    ss << ToSchemeHostAndPort() << ToPathQuery() << fragment;
    return ss.str();
}

HttpUrl::operator std::string() const {
    return ToString();
}

std::string HttpUrl::Scheme() const { return scheme; }
std::string HttpUrl::Host() const { return host; }
std::string HttpUrl::Port() const { return port; }
std::string HttpUrl::Path() const { return path; }
std::string HttpUrl::Query() const { return query; }
std::string HttpUrl::Fragment() const { return fragment; }

HttpUrl& HttpUrl::AppendQueryParameter(const std::string& encoded_key, const std::string& encoded_value) {
    if (query.empty() || query == "?") {
        query = "?";
    } else {
        query += "&";
    }
    query += encoded_key + "=" + encoded_value;
    return *this;
}

// ----------------------------------------------------------------------

HttpParams::HttpParams()
    : timeout(DEFAULT_TIMEOUT),
      retries(DEFAULT_RETRIES),
      retry_wait_ms(DEFAULT_RETRY_WAIT_MS),
      retry_backoff(DEFAULT_RETRY_BACKOFF),
      keep_alive(DEFAULT_KEEP_ALIVE)
{
}

// ----------------------------------------------------------------------

std::string HttpMethod::ToString() const
{
    switch (variant)
    {
    case GET:
        return "GET";
    case POST:
        return "POST";
    default:
        return "UNDEFINED";
    }
}

// ----------------------------------------------------------------------

HttpRequest::HttpRequest(HttpMethod method, const std::string &url, std::string content_type, std::string content)
    : method(method), url(HttpUrl(url)), content_type(std::move(content_type)), content(std::move(content))
{ }

HttpRequest::HttpRequest(HttpMethod method, const std::string &url)
    : HttpRequest(method, url, std::string("application/json"), std::string())
{ }

void HttpRequest::BearerAuth(const std::string &access_token)
{
    headers["Authorization"] = "Bearer " + access_token;
}

// ----------------------------------------------------------------------

HttpResponse::HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content)
    : method(method), url(std::move(url)), code(code), content_type(std::move(content_type)), content(std::move(content))
{ }

HttpResponse::HttpResponse(HttpMethod method, HttpUrl url, int code)
    : HttpResponse(method, std::move(url), code, std::string(), std::string())
{ }

int HttpResponse::Code() const
{
    return code;
}

bool HttpResponse::IsSuccess() const
{
    return code >= 200 && code < 300;
}

std::string HttpResponse::Content() const
{
    return content;
}

// ----------------------------------------------------------------------

HttpClient::HttpClient() : HttpClient(HttpParams())
{ }

HttpClient::HttpClient(const HttpParams &http_params) : http_params(http_params)
{ }

bool HttpClient::IsRetryableStatus(int status)
{
    switch (status) {
        case 408: // Request Timeout
        case 429: // Rate limiter hit
        case 503: // Server has error
        case 504: // Server has error
            return true;
        default:
            return false;
    }
}

uint64_t HttpClient::CalculateSleepTime(uint64_t n_tries) const
{
    if (n_tries < 2) {
        return http_params.retry_wait_ms;
    }
    auto ret = ((float)http_params.retry_wait_ms * std::pow(http_params.retry_backoff, (float)(n_tries - 2)));
    return (uint64_t)ret;
}

std::unique_ptr<httplib::Client> HttpClient::CreateHttplibClient(const std::string &scheme_host_and_port) const
{
    auto c = std::make_unique<httplib::Client>(scheme_host_and_port);
    c->set_follow_location(true);
    c->set_keep_alive(http_params.keep_alive);
    c->enable_server_certificate_verification(true);
    c->set_write_timeout(std::chrono::milliseconds(http_params.timeout));
    c->set_read_timeout(std::chrono::milliseconds(http_params.timeout));
    c->set_connection_timeout(std::chrono::milliseconds(http_params.timeout));
    c->set_decompress(true);
    return c;
}

httplib::Result HttpClient::Execute(httplib::Client &client, HttpRequest &request) const
{
    auto path_str = request.url.ToPathQuery();

    httplib::Headers headers;
    for (const auto &header : request.headers) {
        headers.emplace(header.first, header.second);
    }

    FEISHU_TRACE_INFO("HTTP_REQUEST", "Executing " + request.method.ToString() + " request to: " + request.url.ToSchemeHostAndPort() + request.url.Path());

    if (request.method == HttpMethod::GET)
    {
        return client.Get(path_str, headers);
    }
    else if (request.method == HttpMethod::POST)
    {
        return client.Post(path_str, headers, request.content, request.content_type);
    }
    throw std::invalid_argument("Invalid HTTP method");
}

std::unique_ptr<HttpResponse> HttpClient::SendRequest(HttpRequest &request)
{
    uint64_t n_tries = 0;
    while (true)
    {
        auto client = CreateHttplibClient(request.url.ToSchemeHostAndPort());
        auto res = Execute(*client, request);
        auto err = res.error();

        if (err == httplib::Error::Success)
        {
            FEISHU_TRACE_INFO("HTTP_RESPONSE", "Response status: " + std::to_string(res->status));
            FEISHU_TRACE_DEBUG("HTTP_RESPONSE", "Response body (" + std::to_string(res->body.length()) + " bytes)");

            if (!IsRetryableStatus(res->status) || n_tries + 1 >= http_params.retries) {
                auto response = std::make_unique<HttpResponse>(request.method, request.url, res->status,
                                                               res->get_header_value("Content-Type"), res->body);
                for (const auto &header : res->headers) {
                    response->headers.emplace(header.first, header.second);
                }
                return response;
            }
        }
        else
        {
            FEISHU_TRACE_ERROR("HTTP_RESPONSE", "Request failed: " + httplib::to_string(err));
        }

        n_tries += 1;
        if (n_tries >= http_params.retries)
        {
            throw HttpException(httplib::to_string(err) + " error for HTTP " + request.method.ToString() +
                                " to '" + request.url.ToSchemeHostAndPort() + request.url.Path() + "'");
        }

        auto sleep_amount = CalculateSleepTime(n_tries);
        FEISHU_TRACE_DEBUG("HTTP_REQUEST", "Retrying in " + std::to_string(sleep_amount) + "ms (attempt " + std::to_string(n_tries + 1) + ")");
        std::this_thread::sleep_for(std::chrono::milliseconds(sleep_amount));
    }
}

} // namespace feishu_auth
