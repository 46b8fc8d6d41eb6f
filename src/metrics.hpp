#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Process-wide request counters and latency samples, rendered in the
// Prometheus text exposition format. All methods are thread-safe.
class Metrics
{
public:
    // Quantiles are computed over at most this many recent samples.
    // The summary count and sum cover every sample.
    static constexpr size_t LATENCY_WINDOW = 10000;

    void recordHttpRequest(const std::string& path, int status);
    void recordWebhookResult(const std::string& result);
    void recordLatency(double latency_ms);

    // Number of latency samples currently kept for the quantiles.
    size_t latencySamples() const;

    // Text format 0.0.4. Series are sorted by label values. The latency
    // summary is left out until there is at least one sample.
    std::string render() const;

private:
    mutable std::mutex lock;
    std::map<std::pair<std::string, int>, int64_t> http_requests;
    std::map<std::string, int64_t> webhook_requests;
    int64_t latency_count = 0;
    double latency_sum = 0.0;
    // Ring buffer of the most recent samples; `latency_next` is the
    // slot to overwrite once it is full.
    std::vector<double> latency_window;
    size_t latency_next = 0;
};
