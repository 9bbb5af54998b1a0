// SPDX-License-Identifier: Apache-2.0
#include "EventStream.hpp"

#include <core/Log.hpp>
#include <net/HttpClient.hpp>

#include <curl/curl.h>

#include <condition_variable>
#include <format>
#include <mutex>

namespace mcpbridge::sse
{

auto Parser::feed(std::string_view chunk) -> std::vector<Event>
{
    auto events = std::vector<Event> {};
    _buffer.append(chunk);

    auto start = std::size_t { 0 };
    while (true)
    {
        auto const newline = _buffer.find('\n', start);
        if (newline == std::string::npos)
            break;

        auto line = std::string_view(_buffer).substr(start, newline - start);
        if (line.ends_with('\r'))
            line.remove_suffix(1);
        processLine(line, events);
        start = newline + 1;
    }

    _buffer.erase(0, start);
    return events;
}

void Parser::processLine(std::string_view line, std::vector<Event>& events)
{
    if (line.empty())
    {
        if (_hasData)
        {
            if (_current.data.ends_with('\n'))
                _current.data.pop_back();
            events.push_back(std::move(_current));
        }
        _current = Event {};
        _hasData = false;
        return;
    }

    if (line.starts_with(':'))
        return;

    auto const colon = line.find(':');
    auto const field = line.substr(0, colon);
    auto value = colon == std::string_view::npos ? std::string_view {} : line.substr(colon + 1);
    if (value.starts_with(' '))
        value.remove_prefix(1);

    if (field == "event")
        _current.type = std::string(value);
    else if (field == "data")
    {
        _current.data.append(value);
        _current.data.push_back('\n');
        _hasData = true;
    }
    else if (field == "id")
        _current.id = std::string(value);
}

struct CurlEventStream::Impl
{
    Channel<Event> events;
    Parser parser;
    std::atomic<bool> stopping = false;

    std::mutex openMutex;
    std::condition_variable openCv;
    std::optional<VoidResult> openResult;
    CURL* curl = nullptr;

    void signalOpen(VoidResult result)
    {
        {
            auto lock = std::lock_guard(openMutex);
            if (openResult)
                return;
            openResult = std::move(result);
        }
        openCv.notify_all();
    }

    static auto onHeader(char* data, std::size_t size, std::size_t count, void* userdata) -> std::size_t
    {
        auto* self = static_cast<Impl*>(userdata);
        auto const line = std::string_view(data, size * count);
        if (line != "\r\n" && line != "\n")
            return size * count;

        auto status = 0L;
        curl_easy_getinfo(self->curl, CURLINFO_RESPONSE_CODE, &status);
        if (status >= 300 && status < 400)
            return size * count;

        if (status != 200)
        {
            self->signalOpen(makeError(ErrorCode::TransportError, std::format("Event stream rejected with HTTP {}", status)));
            return 0;
        }

        self->signalOpen({});
        return size * count;
    }

    static auto onData(char* data, std::size_t size, std::size_t count, void* userdata) -> std::size_t
    {
        auto* self = static_cast<Impl*>(userdata);
        if (self->stopping)
            return 0;

        for (auto& event: self->parser.feed(std::string_view(data, size * count)))
            self->events.push(std::move(event));
        return size * count;
    }

    static auto onProgress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int
    {
        auto* self = static_cast<Impl*>(userdata);
        return self->stopping ? 1 : 0;
    }

    static void run(const std::shared_ptr<Impl>& self, const StreamRequest& request, std::chrono::milliseconds timeout)
    {
        http::ensureInitialized();

        self->curl = curl_easy_init();
        if (!self->curl)
        {
            self->signalOpen(makeError(ErrorCode::TransportError, "Failed to initialize CURL"));
            self->events.close();
            return;
        }

        curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Accept: text/event-stream");
        headers = curl_slist_append(headers, "Cache-Control: no-cache");
        for (const auto& [name, value]: request.headers)
            headers = curl_slist_append(headers, std::format("{}: {}", name, value).c_str());

        curl_easy_setopt(self->curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(self->curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(self->curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(self->curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(self->curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(self->curl, CURLOPT_HEADERFUNCTION, &Impl::onHeader);
        curl_easy_setopt(self->curl, CURLOPT_HEADERDATA, self.get());
        curl_easy_setopt(self->curl, CURLOPT_WRITEFUNCTION, &Impl::onData);
        curl_easy_setopt(self->curl, CURLOPT_WRITEDATA, self.get());
        curl_easy_setopt(self->curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(self->curl, CURLOPT_XFERINFOFUNCTION, &Impl::onProgress);
        curl_easy_setopt(self->curl, CURLOPT_XFERINFODATA, self.get());

        auto const code = curl_easy_perform(self->curl);

        if (code != CURLE_OK && !self->stopping)
        {
            self->signalOpen(makeError(code == CURLE_OPERATION_TIMEDOUT ? ErrorCode::TimeoutError : ErrorCode::TransportError,
                                       std::format("Event stream {} failed: {}", request.url, curl_easy_strerror(code))));
            log::debug("Event stream {} ended: {}", request.url, curl_easy_strerror(code));
        }
        else
        {
            self->signalOpen(makeError(ErrorCode::TransportError, std::format("Event stream {} closed", request.url)));
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(self->curl);
        self->curl = nullptr;
        self->events.close();
    }
};

CurlEventStream::CurlEventStream(): _impl(std::make_shared<Impl>())
{
}

CurlEventStream::~CurlEventStream()
{
    close();
}

auto CurlEventStream::open(const StreamRequest& request, std::chrono::milliseconds timeout) -> VoidResult
{
    if (_worker.joinable())
        return makeError(ErrorCode::StateError, "Event stream already opened");

    _worker = std::thread([impl = _impl, request, timeout] { Impl::run(impl, request, timeout); });

    auto lock = std::unique_lock(_impl->openMutex);
    if (!_impl->openCv.wait_for(lock, timeout, [this] { return _impl->openResult.has_value(); }))
    {
        lock.unlock();
        close();
        return makeError(ErrorCode::TimeoutError,
                         std::format("Event stream {} did not open within {}ms", request.url, timeout.count()));
    }

    auto result = *_impl->openResult;
    lock.unlock();

    if (!result)
        close();
    return result;
}

auto CurlEventStream::next() -> std::optional<Event>
{
    return _impl->events.receive();
}

void CurlEventStream::close()
{
    _impl->stopping = true;
    _impl->events.close();
    if (_worker.joinable())
        _worker.join();
}

auto curlEventStreamFactory() -> EventStreamFactory
{
    return [] { return std::make_unique<CurlEventStream>(); };
}

} // namespace mcpbridge::sse
