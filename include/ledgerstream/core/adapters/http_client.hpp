#pragma once
#include <functional>
#include <memory>

namespace LedgerStream {

/**
 * @class HttpClient
 * @brief Connection-owning client handed to adapters for one streamEvents() call.
 *
 * Source-specific adapters extend this with their request methods; the core
 * only needs to know that it must be closed exactly once when the run ends.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /// Release pooled connections. Must be idempotent.
    virtual void close() = 0;
    virtual bool isClosed() const = 0;
};

using HttpClientPtr = std::unique_ptr<HttpClient>;
using HttpClientFactory = std::function<HttpClientPtr()>;

/// Client for adapters that never go over the network (local files, fixtures)
class OfflineHttpClient : public HttpClient {
public:
    void close() override { closed_ = true; }
    bool isClosed() const override { return closed_; }

private:
    bool closed_ = false;
};

/**
 * Calls HttpClient::close() when the scope ends, whatever the exit path.
 */
class HttpClientGuard {
public:
    explicit HttpClientGuard(HttpClient& client) : client_(client) {}
    ~HttpClientGuard() { client_.close(); }

    HttpClientGuard(const HttpClientGuard&) = delete;
    HttpClientGuard& operator=(const HttpClientGuard&) = delete;

private:
    HttpClient& client_;
};

} // namespace LedgerStream
