#include "metrics.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <vector>

namespace {

// Nearest rank on a sorted, non-empty list.
double quantile(const std::vector<double>& sorted, double q)
{
    size_t idx = static_cast<size_t>(static_cast<double>(sorted.size()) * q);
    return sorted[std::min(idx, sorted.size() - 1)];
}

} // namespace

void Metrics::recordHttpRequest(const std::string& path, int status)
{
    std::lock_guard<std::mutex> guard(lock);
    http_requests[{path, status}]++;
}

void Metrics::recordWebhookResult(const std::string& result)
{
    std::lock_guard<std::mutex> guard(lock);
    webhook_requests[result]++;
}

void Metrics::recordLatency(double latency_ms)
{
    std::lock_guard<std::mutex> guard(lock);
    latency_count++;
    latency_sum += latency_ms;
    if(latency_window.size() < LATENCY_WINDOW)
    {
        latency_window.push_back(latency_ms);
    }
    else
    {
        latency_window[latency_next] = latency_ms;
        latency_next = (latency_next + 1) % LATENCY_WINDOW;
    }
}

size_t Metrics::latencySamples() const
{
    std::lock_guard<std::mutex> guard(lock);
    return latency_window.size();
}

std::string Metrics::render() const
{
    std::string out;
    int64_t count = 0;
    double sum = 0.0;
    std::vector<double> sorted;
    {
        std::lock_guard<std::mutex> guard(lock);
        out += "# HELP http_requests_total Total HTTP requests by path and status\n";
        out += "# TYPE http_requests_total counter\n";
        for(const auto& [key, n] : http_requests)
        {
            out += std::format("http_requests_total{{path=\"{}\",status=\"{}\"}} {}\n",
                               key.first, key.second, n);
        }

        out += "# HELP webhook_requests_total Total webhook requests by result\n";
        out += "# TYPE webhook_requests_total counter\n";
        for(const auto& [result, n] : webhook_requests)
        {
            out += std::format("webhook_requests_total{{result=\"{}\"}} {}\n",
                               result, n);
        }

        count = latency_count;
        sum = latency_sum;
        sorted = latency_window;
    }

    if(count == 0)
    {
        return out;
    }

    // Sorting happens outside the lock.
    std::sort(sorted.begin(), sorted.end());

    out += "# HELP request_latency_ms Request latency in milliseconds\n";
    out += "# TYPE request_latency_ms summary\n";
    out += std::format("request_latency_ms_count {}\n", count);
    out += std::format("request_latency_ms_sum {}\n", sum);
    for(double q : {0.5, 0.9, 0.99})
    {
        out += std::format("request_latency_ms{{quantile=\"{}\"}} {}\n",
                           q, quantile(sorted, q));
    }
    return out;
}
