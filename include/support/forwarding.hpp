#ifndef IMGRELAY_FORWARDING_HPP
#define IMGRELAY_FORWARDING_HPP

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <string>

namespace imgrelay {

// "https://host:port/a/b?c" -> host "https://host:port", path "/a/b?c"
void splitUrl(const std::string& url, std::string& host, std::string& path);

// Hop-by-hop, proxy/CDN bookkeeping, and headers that are re-set on the outgoing message.
bool isIgnoredHeader(const std::string& name);

// Copies headers (minus the ignored ones) and cookies.
void copyHeaders(const drogon::HttpRequestPtr& from, const drogon::HttpRequestPtr& to);

// Rewritten upload: inbound method and headers, new multipart body.
drogon::HttpRequestPtr buildUploadRequest(const drogon::HttpRequestPtr& inbound,
                                          const std::string& destinationPath,
                                          const std::string& contentType,
                                          std::string body);

// Untouched request for the destination host: same method, path, query, headers and body.
drogon::HttpRequestPtr buildRelayRequest(const drogon::HttpRequestPtr& inbound);

// Downstream response as returned to the client.
drogon::HttpResponsePtr relayResponse(const drogon::HttpResponsePtr& upstream);

}

#endif // IMGRELAY_FORWARDING_HPP
