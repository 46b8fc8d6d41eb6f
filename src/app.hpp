#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <cryptopp/osrng.h>
#include <mw/http_server.hpp>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "ingestion_pipeline.hpp"
#include "message_store.hpp"
#include "metrics.hpp"

class App : public mw::HTTPServer
{
public:
    App() = delete;
    App(const Config& conf, std::unique_ptr<MessageStoreInterface> store,
        const mw::HTTPServer::ListenAddress& listen);

    void handleWebhook(const Request& req, Response& res,
                       const std::string& request_id);
    void handleMessages(const Request& req, Response& res);
    void handleStats(Response& res);
    void handleLive(Response& res) const;
    void handleReady(Response& res);
    void handleMetrics(Response& res) const;

    // 128 random bits in lowercase hex.
    std::string newRequestID();

protected:
    void setup() override;

private:
    using Handler = std::function<void(const Request&, Response&,
                                       const std::string& request_id)>;
    // Wrap a route handler with the request id header, the access log
    // line and the request metrics.
    httplib::Server::Handler instrument(Handler handler);

    const Config config;
    std::unique_ptr<MessageStoreInterface> store;
    IngestionPipeline pipeline;
    Metrics metrics;
    std::mutex random_lock;
    CryptoPP::AutoSeededRandomPool random;
};
