#include "app.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cryptopp/filters.h>
#include <cryptopp/hex.h>
#include <httplib.h>
#include <mw/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "ingestion_pipeline.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace {

constexpr char CONTENT_TYPE_JSON[] = "application/json";
constexpr char CONTENT_TYPE_METRICS[] = "text/plain; version=0.0.4";
constexpr char SIGNATURE_HEADER[] = "X-Signature";
constexpr char REQUEST_ID_HEADER[] = "X-Request-ID";
constexpr int DEFAULT_LIMIT = 50;

void respondJSON(httplib::Response& res, int status, const nlohmann::json& body)
{
    res.status = status;
    res.set_content(body.dump(-1, ' ', false,
                              nlohmann::json::error_handler_t::replace),
                    CONTENT_TYPE_JSON);
}

void respondValidationErrors(httplib::Response& res,
                             const std::vector<ValidationError>& errors)
{
    nlohmann::json detail = nlohmann::json::array();
    for(const ValidationError& e : errors)
    {
        detail.push_back({
            {"loc", e.location},
            {"msg", e.message},
            {"type", "value_error"},
        });
    }
    respondJSON(res, 422, {{"detail", std::move(detail)}});
}

// Log one event as a JSON object, so that its fields stay machine
// readable.
void logRecord(spdlog::level::level_enum level, std::string_view message,
               nlohmann::json fields)
{
    fields["message"] = std::string(message);
    spdlog::log(level, "{}", fields.dump(-1, ' ', false,
                                         nlohmann::json::error_handler_t::replace));
}

void respondInternalError(httplib::Response& res)
{
    respondJSON(res, 500, {{"detail", "internal error"}});
}

// Read an integer query parameter. A missing parameter gives
// `default_value`. Without an explicit `max` the value is bounded by
// INT_MAX. Problems are appended to `errors`.
int intParam(const httplib::Request& req, const std::string& name,
             int default_value, int min, std::optional<int> max,
             std::vector<ValidationError>& errors)
{
    if(!req.has_param(name))
    {
        return default_value;
    }
    const int upper = max.value_or(std::numeric_limits<int>::max());
    const std::string value = req.get_param_value(name);
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(),
                                     result);
    if(value.empty() || ec == std::errc::invalid_argument ||
       ptr != value.data() + value.size())
    {
        errors.push_back({{"query", name},
                "Input should be a valid integer, unable to parse string as an integer"});
        return default_value;
    }
    // Out of the int64 range counts as too small or too large.
    const bool too_small = ec == std::errc::result_out_of_range ?
        value.front() == '-' : result < min;
    const bool too_large = ec == std::errc::result_out_of_range ?
        value.front() != '-' : result > upper;
    if(too_small)
    {
        errors.push_back({{"query", name},
                std::format("Input should be greater than or equal to {}", min)});
        return default_value;
    }
    if(too_large)
    {
        errors.push_back({{"query", name},
                std::format("Input should be less than or equal to {}", upper)});
        return default_value;
    }
    return static_cast<int>(result);
}

// An empty parameter counts as absent.
std::optional<std::string> strParam(const httplib::Request& req,
                                    const std::string& name)
{
    if(!req.has_param(name))
    {
        return std::nullopt;
    }
    std::string value = req.get_param_value(name);
    if(value.empty())
    {
        return std::nullopt;
    }
    return value;
}

nlohmann::json messageToJSON(const Message& msg)
{
    nlohmann::json j = {
        {"message_id", msg.message_id},
        {"from", msg.from_address},
        {"to", msg.to_address},
        {"ts", formatTimestamp(msg.timestamp)},
    };
    if(msg.text.has_value())
    {
        j["text"] = *msg.text;
    }
    else
    {
        j["text"] = nullptr;
    }
    return j;
}

nlohmann::json optionalTime(const std::optional<mw::Time>& t)
{
    if(t.has_value())
    {
        return formatTimestamp(*t);
    }
    return nullptr;
}

} // namespace

App::App(const Config& conf, std::unique_ptr<MessageStoreInterface> message_store,
         const mw::HTTPServer::ListenAddress& listen)
        : mw::HTTPServer(listen),
          config(conf),
          store(std::move(message_store)),
          pipeline(*store, config)
{
}

std::string App::newRequestID()
{
    CryptoPP::byte bytes[16];
    {
        std::lock_guard<std::mutex> guard(random_lock);
        random.GenerateBlock(bytes, sizeof(bytes));
    }
    std::string id;
    CryptoPP::StringSource src(bytes, sizeof(bytes), true,
                               new CryptoPP::HexEncoder(
                                   new CryptoPP::StringSink(id), false));
    return id;
}

void App::handleWebhook(const Request& req, Response& res,
                        const std::string& request_id)
{
    const std::string signature = req.get_header_value(SIGNATURE_HEADER);
    mw::E<IngestOutcome> outcome = pipeline.handle(req.body, signature);
    if(!outcome.has_value())
    {
        logRecord(spdlog::level::err, "Failed to store message",
                  {{"request_id", request_id},
                   {"error", mw::errorMsg(outcome.error())}});
        respondInternalError(res);
        return;
    }

    const char* result = outcomeLabel(outcome->kind);
    metrics.recordWebhookResult(result);
    switch(outcome->kind)
    {
    case IngestOutcome::CREATED:
    case IngestOutcome::DUPLICATE:
        logRecord(spdlog::level::info, "Webhook processed",
                  {{"request_id", request_id},
                   {"message_id", outcome->message_id},
                   {"dup", outcome->kind == IngestOutcome::DUPLICATE},
                   {"result", result}});
        respondJSON(res, 200, {{"status", "ok"}});
        return;
    case IngestOutcome::INVALID_SIGNATURE:
        logRecord(spdlog::level::warn, "Invalid signature",
                  {{"request_id", request_id}, {"result", result}});
        respondJSON(res, 401, {{"detail", "invalid signature"}});
        return;
    case IngestOutcome::VALIDATION_ERROR:
    {
        nlohmann::json errors = nlohmann::json::array();
        for(const ValidationError& e : outcome->errors)
        {
            errors.push_back(e.locationStr() + ": " + e.message);
        }
        logRecord(spdlog::level::warn, "Validation error",
                  {{"request_id", request_id}, {"result", result},
                   {"errors", std::move(errors)}});
        respondValidationErrors(res, outcome->errors);
        return;
    }
    }
}

void App::handleMessages(const Request& req, Response& res)
{
    std::vector<ValidationError> errors;
    int limit = intParam(req, "limit", DEFAULT_LIMIT, 1, MessageStore::MAX_LIMIT,
                         errors);
    int offset = intParam(req, "offset", 0, 0, std::nullopt, errors);

    MessageFilter filter;
    filter.from_address = strParam(req, "from");
    filter.text_query = strParam(req, "q");
    if(std::optional<std::string> since = strParam(req, "since");
       since.has_value())
    {
        filter.since = parseTimestamp(*since);
        if(!filter.since.has_value())
        {
            errors.push_back({{"query", "since"},
                    "timestamp must be ISO-8601 UTC with Z suffix"});
        }
    }

    if(!errors.empty())
    {
        respondValidationErrors(res, errors);
        return;
    }

    mw::E<MessagePage> page = store->listMessages(filter, limit, offset,
                                                  config.queryTimeout());
    if(!page.has_value())
    {
        logRecord(spdlog::level::err, "Failed to list messages",
                  {{"error", mw::errorMsg(page.error())}});
        respondInternalError(res);
        return;
    }

    nlohmann::json data = nlohmann::json::array();
    for(const Message& msg : page->items)
    {
        data.push_back(messageToJSON(msg));
    }
    respondJSON(res, 200, {
            {"data", std::move(data)},
            {"total", page->total},
            {"limit", limit},
            {"offset", offset},
        });
}

void App::handleStats(Response& res)
{
    mw::E<Stats> stats = store->stats(config.queryTimeout());
    if(!stats.has_value())
    {
        logRecord(spdlog::level::err, "Failed to compute stats",
                  {{"error", mw::errorMsg(stats.error())}});
        respondInternalError(res);
        return;
    }

    nlohmann::json per_sender = nlohmann::json::array();
    for(const SenderCount& s : stats->top_senders)
    {
        per_sender.push_back({{"from", s.sender}, {"count", s.count}});
    }
    respondJSON(res, 200, {
            {"total_messages", stats->total},
            {"senders_count", stats->distinct_senders},
            {"messages_per_sender", std::move(per_sender)},
            {"first_message_ts", optionalTime(stats->earliest)},
            {"last_message_ts", optionalTime(stats->latest)},
        });
}

void App::handleLive(Response& res) const
{
    respondJSON(res, 200, {{"status", "ok"}});
}

void App::handleReady(Response& res)
{
    if(config.webhook_secret.empty())
    {
        respondJSON(res, 503, {{"status", "not ready"},
                               {"reason", "WEBHOOK_SECRET not set"}});
        return;
    }
    if(!store->ready())
    {
        respondJSON(res, 503, {{"status", "not ready"},
                               {"reason", "database not ready"}});
        return;
    }
    respondJSON(res, 200, {{"status", "ready"}});
}

void App::handleMetrics(Response& res) const
{
    res.status = 200;
    res.set_content(metrics.render(), CONTENT_TYPE_METRICS);
}

httplib::Server::Handler App::instrument(Handler handler)
{
    return [this, handler = std::move(handler)](const Request& req, Response& res)
    {
        const auto begin = std::chrono::steady_clock::now();
        const std::string request_id = newRequestID();
        res.set_header(REQUEST_ID_HEADER, request_id);

        handler(req, res, request_id);

        const double latency_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - begin).count();
        metrics.recordHttpRequest(req.path, res.status);
        metrics.recordLatency(latency_ms);
        logRecord(spdlog::level::info, "Request handled",
                  {{"request_id", request_id},
                   {"method", req.method},
                   {"path", req.path},
                   {"status", res.status},
                   {"latency_ms", std::round(latency_ms * 100.0) / 100.0}});
    };
}

void App::setup()
{
    server.Post("/webhook", instrument(
        [&](const Request& req, Response& res, const std::string& request_id)
        {
            handleWebhook(req, res, request_id);
        }));

    server.Get("/messages", instrument(
        [&](const Request& req, Response& res, const std::string&)
        {
            handleMessages(req, res);
        }));

    server.Get("/stats", instrument(
        [&](const Request&, Response& res, const std::string&)
        {
            handleStats(res);
        }));

    server.Get("/health/live", instrument(
        [&](const Request&, Response& res, const std::string&)
        {
            handleLive(res);
        }));

    server.Get("/health/ready", instrument(
        [&](const Request&, Response& res, const std::string&)
        {
            handleReady(res);
        }));

    server.Get("/metrics", instrument(
        [&](const Request&, Response& res, const std::string&)
        {
            handleMetrics(res);
        }));
}
