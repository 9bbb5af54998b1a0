// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <memory>
#include <mutex>

namespace mcpbridge::http
{

namespace
{

    struct CurlDeleter
    {
        void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
    };

    struct SlistDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    auto writeCallback(char* data, std::size_t size, std::size_t count, void* userdata) -> std::size_t
    {
        auto* body = static_cast<std::string*>(userdata);
        body->append(data, size * count);
        return size * count;
    }

    auto headerCallback(char* data, std::size_t size, std::size_t count, void* userdata) -> std::size_t
    {
        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        auto const line = std::string_view(data, size * count);
        auto const colon = line.find(':');
        if (colon != std::string_view::npos)
        {
            auto name = std::string(line.substr(0, colon));
            std::ranges::transform(name, name.begin(), [](unsigned char c) { return std::tolower(c); });

            auto value = line.substr(colon + 1);
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
                value.remove_prefix(1);
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
                value.remove_suffix(1);

            (*headers)[std::move(name)] = std::string(value);
        }
        return size * count;
    }

} // namespace

void ensureInitialized()
{
    static auto once = std::once_flag {};
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

auto perform(const Request& request) -> Result<Response>
{
    ensureInitialized();

    auto curl = std::unique_ptr<CURL, CurlDeleter>(curl_easy_init());
    if (!curl)
        return makeError(ErrorCode::TransportError, "Failed to initialize CURL");

    auto response = Response {};
    curl_slist* rawHeaders = nullptr;
    for (const auto& [name, value]: request.headers)
    {
        auto const line = std::format("{}: {}", name, value);
        auto* appended = curl_slist_append(rawHeaders, line.c_str());
        if (!appended)
        {
            curl_slist_free_all(rawHeaders);
            return makeError(ErrorCode::TransportError, "Failed to build request headers");
        }
        rawHeaders = appended;
    }
    auto const headerList = std::unique_ptr<curl_slist, SlistDeleter>(rawHeaders);

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
    if (headerList)
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());

    if (request.method == "POST")
    {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }
    else if (request.method != "GET")
    {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    auto const code = curl_easy_perform(curl.get());
    if (code == CURLE_OPERATION_TIMEDOUT)
        return makeError(ErrorCode::TimeoutError,
                         std::format("{} {} timed out after {}ms", request.method, request.url, request.timeout.count()));
    if (code != CURLE_OK)
        return makeError(ErrorCode::TransportError,
                         std::format("{} {} failed: {}", request.method, request.url, curl_easy_strerror(code)));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    log::trace("{} {} -> {}", request.method, request.url, response.status);
    return response;
}

auto get(std::string url, std::chrono::milliseconds timeout) -> Result<Response>
{
    return perform(Request { .method = "GET", .url = std::move(url), .body = {}, .headers = {}, .timeout = timeout });
}

auto resolveUrl(std::string_view base, std::string_view reference) -> std::string
{
    if (reference.find("://") != std::string_view::npos)
        return std::string(reference);

    auto const schemeEnd = base.find("://");
    auto const authorityStart = schemeEnd == std::string_view::npos ? 0 : schemeEnd + 3;
    auto const pathStart = base.find('/', authorityStart);
    auto const origin = base.substr(0, pathStart);

    if (reference.starts_with('/'))
        return std::format("{}{}", origin, reference);

    if (pathStart == std::string_view::npos)
        return std::format("{}/{}", origin, reference);

    auto path = base.substr(pathStart);
    path = path.substr(0, path.find_first_of("?#"));
    return std::format("{}{}{}", origin, path.substr(0, path.rfind('/') + 1), reference);
}

} // namespace mcpbridge::http
