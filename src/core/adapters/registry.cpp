#include <ledgerstream/core/adapters/registry.hpp>
#include <spdlog/spdlog.h>

namespace LedgerStream {

void AdapterRegistry::registerFactory(const std::string& source, AdapterFactory factory) {
    if (!factory) {
        throw std::invalid_argument("Adapter factory for '" + source + "' is empty");
    }
    std::lock_guard<std::mutex> lock(mtx_);
    auto [it, inserted] = factories_.insert_or_assign(source, std::move(factory));
    if (!inserted) {
        spdlog::warn("[AdapterRegistry] Replaced adapter factory for source '{}'", source);
    } else {
        spdlog::debug("[AdapterRegistry] Registered source '{}'", source);
    }
}

AdapterPtr AdapterRegistry::getAdapter(const std::string& source, const AdapterContext& context,
                                       HttpClient& client) const {
    AdapterFactory factory;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = factories_.find(source);
        if (it == factories_.end()) {
            throw UnknownSourceError(source);
        }
        factory = it->second;
    }
    AdapterPtr adapter = factory(context, client);
    if (!adapter) {
        throw std::runtime_error("Adapter factory for '" + source + "' returned null");
    }
    return adapter;
}

bool AdapterRegistry::contains(const std::string& source) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return factories_.count(source) > 0;
}

std::vector<std::string> AdapterRegistry::availableSources() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> sources;
    sources.reserve(factories_.size());
    for (const auto& [source, factory] : factories_) {
        sources.push_back(source);
    }
    return sources;
}

} // namespace LedgerStream
