#pragma once

#include <string>
#include <vector>

namespace statusboard::net {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::string body;
    long timeoutSeconds = 5;
};

struct HttpResponse {
    bool transportOk = false;
    long status = 0;
    std::string body;
    std::string error;

    bool ok() const { return transportOk && status >= 200 && status < 300; }
    std::string describeFailure() const;
};

HttpResponse Perform(const HttpRequest &request);

std::string UrlEncode(const std::string &value);

std::string TrimTrailingSlash(std::string value);

} // namespace statusboard::net
