#pragma once
#include <ledgerstream/core/adapters/adapter.hpp>
#include <ledgerstream/core/adapters/http_client.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace LedgerStream {

class UnknownSourceError : public std::runtime_error {
public:
    explicit UnknownSourceError(const std::string& source)
        : std::runtime_error("Unknown adapter source: '" + source + "'"), source_(source) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

using AdapterFactory = std::function<AdapterPtr(const AdapterContext&, HttpClient&)>;

/**
 * @class AdapterRegistry
 * @brief Maps source names to adapter factories.
 *
 * An explicit object owned by the application and passed to the orchestrator.
 * Registration is expected at startup; lookups are safe from any thread.
 */
class AdapterRegistry {
public:
    /// Register (or replace, with a warning) the factory for @p source
    void registerFactory(const std::string& source, AdapterFactory factory);

    /**
     * @brief Build a fresh adapter for @p source bound to @p context and @p client.
     * @throws UnknownSourceError if nothing is registered under @p source
     */
    AdapterPtr getAdapter(const std::string& source, const AdapterContext& context,
                          HttpClient& client) const;

    bool contains(const std::string& source) const;

    /// Sorted source names
    std::vector<std::string> availableSources() const;

private:
    mutable std::mutex mtx_;
    std::map<std::string, AdapterFactory> factories_;
};

} // namespace LedgerStream
