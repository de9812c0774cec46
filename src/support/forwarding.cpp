#include <support/forwarding.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace imgrelay {

void splitUrl(const std::string& url, std::string& host, std::string& path) {
    size_t pos = url.find("://");
    if (pos == std::string::npos) {
        host = url;
        path = "/";
        return;
    }
    pos += 3;
    size_t pathPos = url.find_first_of("/?", pos);
    if (pathPos == std::string::npos) {
        host = url;
        path = "/";
    } else {
        host = url.substr(0, pathPos);
        path = url.substr(pathPos);
        if (path[0] == '?') path.insert(0, "/");
    }
}

bool isIgnoredHeader(const std::string& name) {
    static const std::array<const char*, 21> ignoreHeaders = {
        "connection",
        "keep-alive",
        "proxy-authenticate",
        "proxy-authorization",
        "te",
        "trailers",
        "transfer-encoding",
        "upgrade",
        "accept-encoding",
        "host",
        "cf-ipcountry",
        "cf-connecting-ip",
        "x-forwarded-proto",
        "x-forwarded-for",
        "cf-ray",
        "cf-visitor",
        "cf-warp-tag-id",
        "content-type",
        "origin",
        "x-amzn-trace-id",
        "content-length",
    };

    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(ignoreHeaders.begin(), ignoreHeaders.end(), lowered) != ignoreHeaders.end();
}

void copyHeaders(const drogon::HttpRequestPtr& from, const drogon::HttpRequestPtr& to) {
    for (const auto& [name, value] : from->headers()) {
        if (isIgnoredHeader(name)) continue;
        to->addHeader(name, value);
    }
    for (const auto& [name, value] : from->cookies()) {
        to->addCookie(name, value);
    }
}

drogon::HttpRequestPtr buildUploadRequest(const drogon::HttpRequestPtr& inbound,
                                          const std::string& destinationPath,
                                          const std::string& contentType,
                                          std::string body) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(inbound->method());
    req->setPathEncode(false);
    req->setPath(destinationPath);
    copyHeaders(inbound, req);
    req->setContentTypeString(contentType);
    req->setBody(std::move(body));
    return req;
}

drogon::HttpRequestPtr buildRelayRequest(const drogon::HttpRequestPtr& inbound) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(inbound->method());

    // Keep the client's encoding of the path
    const std::string& originalPath = inbound->getOriginalPath();
    std::string target = originalPath.empty() ? inbound->path() : originalPath;
    if (!inbound->query().empty()) {
        target += "?" + inbound->query();
    }
    req->setPathEncode(false);
    req->setPath(target);

    copyHeaders(inbound, req);
    // Otherwise the destination sees the proxy as host
    req->addHeader("X-Forwarded-Host", inbound->getHeader("host"));

    const std::string& contentType = inbound->getHeader("content-type");
    if (!contentType.empty()) {
        req->setContentTypeString(contentType);
    }
    req->setBody(std::string(inbound->body()));
    return req;
}

drogon::HttpResponsePtr relayResponse(const drogon::HttpResponsePtr& upstream) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(upstream->statusCode());
    for (const auto& [name, value] : upstream->headers()) {
        if (isIgnoredHeader(name)) continue;
        resp->addHeader(name, value);
    }
    for (const auto& [name, cookie] : upstream->cookies()) {
        resp->addCookie(cookie);
    }

    const std::string& contentType = upstream->getHeader("content-type");
    if (!contentType.empty()) {
        resp->setContentTypeString(contentType);
    }
    resp->setBody(std::string(upstream->body()));
    return resp;
}

}
