#include "webhook_server.hpp"
#include <spdlog/spdlog.h>

WebhookServer::WebhookServer(const Config& config, WebhookIngestor& ingestor,
                             JsonProvider metrics_provider, JsonProvider health_provider)
    : config_(config),
      ingestor_(ingestor),
      metrics_provider_(std::move(metrics_provider)),
      health_provider_(std::move(health_provider)),
      running_(false) {
    server_ = std::make_unique<httplib::Server>();
    setup_routes();
}

WebhookServer::~WebhookServer() {
    stop();
}

void WebhookServer::start() {
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting webhook server on {}:{}", config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("Webhook server failed to listen on {}:{}", config_.listen_addr, config_.listen_port);
            running_ = false;
        }
    });
}

void WebhookServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    if (running_.exchange(false)) {
        spdlog::info("Webhook server stopped");
    }
}

bool WebhookServer::is_running() const {
    return running_;
}

void WebhookServer::handle_webhook(const httplib::Request& req, httplib::Response& res) {
    try {
        IngestRequest request;
        request.provider = req.matches[1].str();
        request.authorization = req.get_header_value("Authorization");
        request.forwarded_for = req.get_header_value("X-Forwarded-For");
        request.real_ip = req.get_header_value("X-Real-IP");
        request.remote_addr = req.remote_addr;
        request.body = req.body;

        auto response = ingestor_.handle(request);

        res.status = response.status;
        if (response.retry_after_seconds) {
            res.set_header("Retry-After", std::to_string(*response.retry_after_seconds));
        }
        res.set_content(response.body.dump(), "application/json");

    } catch (const std::exception& e) {
        spdlog::error("Webhook processing error: {}", e.what());
        res.status = 500;
        res.set_content(R"({"ok":false,"error":"internal_error"})", "application/json");
    }
}

void WebhookServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        try {
            auto health = health_provider_();
            res.status = health.value("status", "ok") == "ok" ? 200 : 503;
            res.set_content(health.dump(2), "application/json");
        } catch (const std::exception& e) {
            spdlog::error("Health handler error: {}", e.what());
            res.status = 500;
            res.set_content(R"({"status":"error"})", "application/json");
        }
    });

    server_->Get("/webhooks/metrics", [this](const httplib::Request&, httplib::Response& res) {
        try {
            res.set_content(metrics_provider_().dump(2), "application/json");
        } catch (const std::exception& e) {
            spdlog::error("Metrics handler error: {}", e.what());
            res.status = 500;
            res.set_content(R"({"ok":false,"error":"internal_error"})", "application/json");
        }
    });

    server_->Post(R"(/webhooks/([A-Za-z0-9_\-]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_webhook(req, res);
    });

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            nlohmann::json body = {
                {"ok", false},
                {"error", res.status == 404 ? "not_found" : "http_error"},
                {"status", res.status}
            };
            res.set_content(body.dump(), "application/json");
        }
    });
}
