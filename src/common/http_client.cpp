#include "common/http_client.hpp"

#include "common/curl_global.hpp"
#include "common/json.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace {

size_t AppendResponse(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *buffer = static_cast<std::string *>(userdata);
    const size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

// Pulls a human readable reason out of a JSON error body ({"message": "..."}).
std::string extractErrorMessage(const std::string &body) {
    if (body.empty()) {
        return {};
    }
    try {
        const auto jsonData = statusboard::json::Parse(body);
        if (jsonData.is_object() && jsonData.contains("message") && jsonData["message"].is_string()) {
            return jsonData["message"].get<std::string>();
        }
    } catch (const std::exception &) {
        return {};
    }
    return {};
}

} // namespace

namespace statusboard::net {

std::string HttpResponse::describeFailure() const {
    std::string reason;
    if (!error.empty()) {
        reason = error;
    }
    if (status > 0 && (status < 200 || status >= 300)) {
        if (!reason.empty()) {
            reason += ", ";
        }
        reason += "http_status=" + std::to_string(status);
    }
    if (reason.empty()) {
        reason = "request failed";
    }
    return reason;
}

HttpResponse Perform(const HttpRequest &request) {
    HttpResponse response;
    if (!EnsureCurlGlobalInit()) {
        response.error = "curl_init_failed";
        return response;
    }

    CURL *curlHandle = curl_easy_init();
    if (!curlHandle) {
        response.error = "curl_easy_init failed";
        return response;
    }

    char errorBuffer[CURL_ERROR_SIZE];
    errorBuffer[0] = '\0';

    struct curl_slist *headerList = nullptr;
    for (const auto &header : request.headers) {
        headerList = curl_slist_append(headerList, header.c_str());
    }

    curl_easy_setopt(curlHandle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curlHandle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curlHandle, CURLOPT_TIMEOUT, request.timeoutSeconds);
    curl_easy_setopt(curlHandle, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, AppendResponse);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEDATA, &response.body);
    if (headerList) {
        curl_easy_setopt(curlHandle, CURLOPT_HTTPHEADER, headerList);
    }

    if (request.method == "POST") {
        curl_easy_setopt(curlHandle, CURLOPT_POST, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curlHandle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    if (!request.body.empty()) {
        curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    const CURLcode result = curl_easy_perform(curlHandle);
    if (result == CURLE_OK) {
        curl_easy_getinfo(curlHandle, CURLINFO_RESPONSE_CODE, &response.status);
    }
    curl_slist_free_all(headerList);
    curl_easy_cleanup(curlHandle);

    if (result != CURLE_OK) {
        if (errorBuffer[0] != '\0') {
            response.error = errorBuffer;
        } else {
            response.error = curl_easy_strerror(result);
        }
        return response;
    }

    response.transportOk = true;
    if (!response.ok()) {
        response.error = extractErrorMessage(response.body);
    }
    spdlog::trace("http: {} request finished with status {}", request.method, response.status);
    return response;
}

std::string UrlEncode(const std::string &value) {
    if (!EnsureCurlGlobalInit()) {
        return {};
    }
    CURL *curlHandle = curl_easy_init();
    if (!curlHandle) {
        return {};
    }
    char *escaped = curl_easy_escape(curlHandle, value.c_str(), static_cast<int>(value.size()));
    std::string result;
    if (escaped) {
        result = escaped;
        curl_free(escaped);
    }
    curl_easy_cleanup(curlHandle);
    return result;
}

std::string TrimTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

} // namespace statusboard::net
