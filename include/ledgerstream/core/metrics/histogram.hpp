#pragma once

#include <array>
#include <atomic>
#include <algorithm>
#include <cstdint>
#include <string>
#include <spdlog/spdlog.h>

namespace LedgerStream {

/**
 * @brief Lock-free duration histogram using log2 buckets over nanoseconds.
 *
 * - Bucket i covers [2^i, 2^(i+1)) ns, bucket 0 also holds 0 and 1
 * - record() is two relaxed fetch_adds, safe from any thread
 * - Percentiles are approximated by the bucket midpoint
 *
 * Used for run duration, checkpoint-to-checkpoint latency, ledger load time and
 * time spent per ledger state. Values up to ~292 years fit.
 */
class DurationHistogram {
public:
    static constexpr size_t NUM_BUCKETS = 64;

    void record(uint64_t duration_ns) {
        buckets_[bucketFor(duration_ns)].fetch_add(1, std::memory_order_relaxed);
        total_count_.fetch_add(1, std::memory_order_relaxed);
        total_ns_.fetch_add(duration_ns, std::memory_order_relaxed);
    }

    void recordSeconds(double seconds) {
        if (seconds < 0.0) seconds = 0.0;
        record(static_cast<uint64_t>(seconds * 1e9));
    }

    uint64_t count() const {
        return total_count_.load(std::memory_order_relaxed);
    }

    double sumSeconds() const {
        return static_cast<double>(total_ns_.load(std::memory_order_relaxed)) / 1e9;
    }

    uint64_t bucketCount(size_t bucket) const {
        if (bucket >= NUM_BUCKETS) return 0;
        return buckets_[bucket].load(std::memory_order_relaxed);
    }

    /**
     * @brief Approximate percentile (0-100) in nanoseconds.
     * Walks cumulative bucket counts; no sample vector is materialized.
     */
    uint64_t percentileNs(double percentile) const {
        uint64_t total = count();
        if (total == 0) return 0;

        percentile = std::clamp(percentile, 0.0, 100.0);
        uint64_t rank = static_cast<uint64_t>((percentile / 100.0) * static_cast<double>(total));
        if (rank >= total) rank = total - 1;

        uint64_t seen = 0;
        for (size_t b = 0; b < NUM_BUCKETS; ++b) {
            seen += bucketCount(b);
            if (seen > rank) {
                return midpoint(b);
            }
        }
        return midpoint(NUM_BUCKETS - 1);
    }

    double percentileSeconds(double percentile) const {
        return static_cast<double>(percentileNs(percentile)) / 1e9;
    }

    void logSummary(const std::string& name) const {
        uint64_t total = count();
        if (total == 0) {
            spdlog::info("[Metrics] {}: no samples", name);
            return;
        }
        spdlog::info("[Metrics] {}: count={} sum={:.3f}s p50={:.6f}s p99={:.6f}s",
                     name, total, sumSeconds(), percentileSeconds(50), percentileSeconds(99));
    }

    void reset() {
        for (auto& bucket : buckets_) {
            bucket.store(0, std::memory_order_relaxed);
        }
        total_count_.store(0, std::memory_order_relaxed);
        total_ns_.store(0, std::memory_order_relaxed);
    }

private:
    std::array<std::atomic<uint64_t>, NUM_BUCKETS> buckets_{};
    std::atomic<uint64_t> total_count_{0};
    std::atomic<uint64_t> total_ns_{0};

    static size_t bucketFor(uint64_t ns) {
        if (ns <= 1) return 0;
        int msb = 63 - __builtin_clzll(ns);
        return std::min(static_cast<size_t>(msb), NUM_BUCKETS - 1);
    }

    static uint64_t midpoint(size_t bucket) {
        if (bucket == 0) return 0;
        uint64_t low = 1ULL << bucket;
        return low + low / 2;
    }
};

} // namespace LedgerStream
