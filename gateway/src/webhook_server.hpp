#pragma once
#include "config.hpp"
#include "webhook_ingestor.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <thread>

class WebhookServer {
public:
    using JsonProvider = std::function<nlohmann::json()>;

    WebhookServer(const Config& config, WebhookIngestor& ingestor,
                  JsonProvider metrics_provider, JsonProvider health_provider);
    ~WebhookServer();

    void start();
    void stop();
    bool is_running() const;

private:
    void setup_routes();
    void handle_webhook(const httplib::Request& req, httplib::Response& res);

    const Config& config_;
    WebhookIngestor& ingestor_;
    JsonProvider metrics_provider_;
    JsonProvider health_provider_;

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
};
