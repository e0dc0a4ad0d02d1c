#include "catch2/catch.hpp"
#include "http_client.hpp"

using namespace feishu_auth;

TEST_CASE("HttpUrl Parsing and Serialization", "[http_url]") {
    SECTION("Parsing valid URLs") {
        HttpUrl url("https://open.feishu.cn:8443/connect/qrconnect/page/sso?lang=zh#top");
        REQUIRE(url.Scheme() == "https");
        REQUIRE(url.Host() == "open.feishu.cn");
        REQUIRE(url.Port() == "8443");
        REQUIRE(url.Path() == "/connect/qrconnect/page/sso");
        REQUIRE(url.Query() == "?lang=zh");
        REQUIRE(url.Fragment() == "#top");
    }

    SECTION("Serializing URL components back to string") {
        HttpUrl url("http://www.example.com/path");
        REQUIRE(url.ToSchemeHostAndPort() == "http://www.example.com");
        REQUIRE(url.ToPathQuery() == "/path");
        REQUIRE(url.ToString() == "http://www.example.com/path");
    }

    SECTION("Empty path serializes as root") {
        HttpUrl url("https://example.com");
        REQUIRE(url.ToPathQuery() == "/");
    }

    SECTION("Appending query parameters") {
        HttpUrl url("https://example.com/auth");
        url.AppendQueryParameter("app_id", "cli_1").AppendQueryParameter("scope", "a%2Cb");
        REQUIRE(url.ToString() == "https://example.com/auth?app_id=cli_1&scope=a%2Cb");

        HttpUrl with_query("https://example.com/auth?lang=en");
        with_query.AppendQueryParameter("state", "xyz");
        REQUIRE(with_query.Query() == "?lang=en&state=xyz");
    }
}

TEST_CASE("HttpMethod conversion", "[http_method]") {
    REQUIRE(HttpMethod(HttpMethod::GET).ToString() == "GET");
    REQUIRE(HttpMethod(HttpMethod::POST).ToString() == "POST");
    REQUIRE(HttpMethod().IsUndefined());
    REQUIRE(HttpMethod().ToString() == "UNDEFINED");
}

TEST_CASE("HttpRequest and HttpResponse", "[http_request]") {
    SECTION("Bearer authentication header") {
        HttpRequest request(HttpMethod::GET, "https://open.feishu.cn/user_info");
        request.BearerAuth("u-token");
        REQUIRE(request.headers["authorization"] == "Bearer u-token");
        REQUIRE(request.content_type == "application/json");
    }

    SECTION("Success range") {
        HttpUrl url("https://example.com");
        REQUIRE(HttpResponse(HttpMethod::GET, url, 200).IsSuccess());
        REQUIRE(HttpResponse(HttpMethod::GET, url, 204).IsSuccess());
        REQUIRE_FALSE(HttpResponse(HttpMethod::GET, url, 302).IsSuccess());
        REQUIRE_FALSE(HttpResponse(HttpMethod::GET, url, 500).IsSuccess());
    }
}

TEST_CASE("HttpClient retry policy", "[http_client]") {
    SECTION("Transient statuses are retried") {
        REQUIRE(HttpClient::IsRetryableStatus(408));
        REQUIRE(HttpClient::IsRetryableStatus(429));
        REQUIRE(HttpClient::IsRetryableStatus(503));
        REQUIRE(HttpClient::IsRetryableStatus(504));
        REQUIRE_FALSE(HttpClient::IsRetryableStatus(400));
        REQUIRE_FALSE(HttpClient::IsRetryableStatus(401));
        REQUIRE_FALSE(HttpClient::IsRetryableStatus(500));
    }

    SECTION("Backoff grows exponentially") {
        HttpParams params;
        params.retry_wait_ms = 100;
        params.retry_backoff = 4;
        HttpClient client(params);
        REQUIRE(client.CalculateSleepTime(1) == 100);
        REQUIRE(client.CalculateSleepTime(2) == 100);
        REQUIRE(client.CalculateSleepTime(3) == 400);
        REQUIRE(client.CalculateSleepTime(4) == 1600);
    }

    SECTION("Default parameters") {
        HttpClient client;
        REQUIRE(client.Params().timeout == HttpParams::DEFAULT_TIMEOUT);
        REQUIRE(client.Params().retries == HttpParams::DEFAULT_RETRIES);
    }
}
