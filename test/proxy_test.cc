#include <drogon/drogon_test.h>
#include <support/forwarding.hpp>

using namespace imgrelay;

DROGON_TEST(SplitUrl)
{
    std::string host, path;

    splitUrl("https://httpbin.org/anything", host, path);
    CHECK(host == "https://httpbin.org");
    CHECK(path == "/anything");

    splitUrl("http://127.0.0.1:2283/api/assets?key=abc", host, path);
    CHECK(host == "http://127.0.0.1:2283");
    CHECK(path == "/api/assets?key=abc");

    splitUrl("http://immich:2283", host, path);
    CHECK(host == "http://immich:2283");
    CHECK(path == "/");

    splitUrl("http://immich?x=1", host, path);
    CHECK(host == "http://immich");
    CHECK(path == "/?x=1");
}

DROGON_TEST(IgnoredHeaders)
{
    for (const char* name : {"Connection", "keep-alive", "Transfer-Encoding", "Accept-Encoding", "HOST",
                             "Cf-Ray", "cf-connecting-ip", "X-Forwarded-For", "X-Forwarded-Proto",
                             "Content-Type", "content-length", "Origin", "X-Amzn-Trace-Id", "Te", "Upgrade"}) {
        CHECK(isIgnoredHeader(name));
    }
    for (const char* name : {"Authorization", "x-api-key", "Cookie", "User-Agent", "X-Forwarded-Host", "Accept"}) {
        CHECK(!isIgnoredHeader(name));
    }
}

DROGON_TEST(BuildRelayRequest)
{
    auto inbound = drogon::HttpRequest::newHttpRequest();
    inbound->setMethod(drogon::Put);
    inbound->setPath("/api/albums/1");
    inbound->addHeader("Host", "photos.example.com");
    inbound->addHeader("X-Api-Key", "secret");
    inbound->addHeader("Cf-Ray", "8a1b2c");
    inbound->addHeader("Connection", "keep-alive");
    inbound->addHeader("Accept-Encoding", "gzip");
    inbound->addCookie("session", "s1");
    inbound->setBody("{\"name\":\"Holiday\"}");

    auto relayed = buildRelayRequest(inbound);
    CHECK(relayed->method() == drogon::Put);
    CHECK(relayed->path() == "/api/albums/1");
    CHECK(relayed->getHeader("x-api-key") == "secret");
    CHECK(relayed->getHeader("cf-ray").empty());
    CHECK(relayed->getHeader("connection").empty());
    CHECK(relayed->getHeader("accept-encoding").empty());
    CHECK(relayed->getHeader("host").empty());
    CHECK(relayed->getHeader("x-forwarded-host") == "photos.example.com");
    CHECK(relayed->getCookie("session") == "s1");
    CHECK(relayed->body() == "{\"name\":\"Holiday\"}");
}

DROGON_TEST(BuildUploadRequest)
{
    auto inbound = drogon::HttpRequest::newHttpRequest();
    inbound->setMethod(drogon::Post);
    inbound->setPath("/api/assets");
    inbound->addHeader("Authorization", "Bearer token");
    inbound->addHeader("Content-Type", "multipart/form-data; boundary=old");
    inbound->addHeader("Content-Length", "123");

    auto upload = buildUploadRequest(inbound, "/anything?trace=1", "multipart/form-data; boundary=new", "BODY");
    CHECK(upload->method() == drogon::Post);
    CHECK(upload->path() == "/anything?trace=1");
    CHECK(upload->getHeader("authorization") == "Bearer token");
    CHECK(upload->getHeader("content-length").empty());
    CHECK(upload->getHeader("content-type") != "multipart/form-data; boundary=old");
    CHECK(upload->body() == "BODY");
}

DROGON_TEST(RelayResponse)
{
    auto upstream = drogon::HttpResponse::newHttpResponse();
    upstream->setStatusCode(drogon::k201Created);
    upstream->addHeader("X-Request-Id", "abc123");
    upstream->addHeader("Connection", "close");
    upstream->addHeader("Transfer-Encoding", "chunked");
    upstream->addCookie("immich_session", "xyz");
    upstream->setBody("{\"id\":\"asset-1\"}");

    auto resp = relayResponse(upstream);
    CHECK(resp->statusCode() == drogon::k201Created);
    CHECK(resp->getHeader("x-request-id") == "abc123");
    CHECK(resp->getHeader("connection").empty());
    CHECK(resp->getHeader("transfer-encoding").empty());
    CHECK(resp->getCookie("immich_session").value() == "xyz");
    CHECK(resp->body() == "{\"id\":\"asset-1\"}");
}
