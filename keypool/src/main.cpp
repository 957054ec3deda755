#include "config.hpp"
#include "store_pg.hpp"
#include "redis_bus.hpp"
#include "key_pool.hpp"
#include "request_executor.hpp"
#include "error_classifier.hpp"
#include "http_client.hpp"
#include "quota_clock.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <map>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void reply_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

nlohmann::json keys_json(KeyPoolManager& pool) {
    nlohmann::json keys = nlohmann::json::array();
    for (const auto& key : pool.snapshot_status()) {
        keys.push_back(key.to_json());
    }
    return {
        {"keys", keys},
        {"summary", pool.quota_summary().to_json()},
        {"reset_in_ms", quota_clock::ms_until_next_reset(util::current_timestamp_ms())}
    };
}

void register_routes(httplib::Server& server,
                     std::shared_ptr<KeyPoolManager> pool,
                     std::shared_ptr<RequestExecutor> executor,
                     std::shared_ptr<ApiHttpClient> api,
                     std::shared_ptr<HealthCheck> health) {

    server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
        auto status = health->get_status();
        reply_json(res, status["ok"].get<bool>() ? 200 : 503, status);
    });

    server.Get("/keys", [pool](const httplib::Request&, httplib::Response& res) {
        try {
            reply_json(res, 200, keys_json(*pool));
        } catch (const std::exception& e) {
            spdlog::error("Failed to read key status: {}", e.what());
            reply_json(res, 500, {{"error", e.what()}});
        }
    });

    server.Post("/keys/rotate", [pool](const httplib::Request&, httplib::Response& res) {
        try {
            int from = pool->active_index();
            if (pool->rotate(true)) {
                reply_json(res, 200, {{"rotated", true}, {"from", from},
                                      {"to", pool->active_index()}});
            } else {
                reply_json(res, 409, {{"rotated", false},
                                      {"error", "all keys may be exhausted"}});
            }
        } catch (const std::exception& e) {
            spdlog::error("Forced rotation failed: {}", e.what());
            reply_json(res, 500, {{"error", e.what()}});
        }
    });

    server.Post(R"(/keys/(\d+)/enable)", [pool](const httplib::Request& req, httplib::Response& res) {
        try {
            int index = std::stoi(req.matches[1].str());
            if (pool->enable_key(index)) {
                reply_json(res, 200, {{"enabled", index}});
            } else {
                reply_json(res, 404, {{"error", "unknown key index"}});
            }
        } catch (const std::out_of_range&) {
            reply_json(res, 404, {{"error", "unknown key index"}});
        } catch (const std::exception& e) {
            spdlog::error("Failed to enable key: {}", e.what());
            reply_json(res, 500, {{"error", e.what()}});
        }
    });

    server.Post("/call", [executor, api](const httplib::Request& req, httplib::Response& res) {
        std::string path;
        std::map<std::string, std::string> params;
        int64_t cost = 1;

        try {
            auto body = nlohmann::json::parse(req.body);
            path = body.at("path").get<std::string>();
            if (body.contains("params")) {
                for (auto& [key, value] : body["params"].items()) {
                    params[key] = value.is_string() ? value.get<std::string>() : value.dump();
                }
            }
            cost = body.value("cost", static_cast<int64_t>(1));
        } catch (const std::exception& e) {
            reply_json(res, 400, {{"error", std::string("malformed request: ") + e.what()}});
            return;
        }

        try {
            auto result = executor->execute(
                [&](const std::string& api_key) { return api->get(path, params, api_key); },
                cost);
            reply_json(res, 200, result);
        } catch (const std::invalid_argument& e) {
            reply_json(res, 400, {{"error", std::string("malformed request: ") + e.what()}});
        } catch (const PoolExhausted& e) {
            reply_json(res, 503, {{"error", "pool_exhausted"}, {"detail", e.last_error()}});
        } catch (const NonRetryableError& e) {
            reply_json(res, 502, {{"error", "non_retryable"}, {"detail", e.what()}});
        } catch (const std::exception& e) {
            spdlog::error("Proxied call to {} failed: {}", path, e.what());
            reply_json(res, 500, {{"error", e.what()}});
        }
    });
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->service_name, config->log_level);

        spdlog::info("==============================================");
        spdlog::info("Key Pool Service v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Initialize components
        auto redis = std::make_shared<RedisBus>(config->redis_url);
        auto pg = std::make_shared<PostgresKeyStore>(config->pg_dsn);
        pg->init_schema();

        QuotaLimits limits{config->daily_quota_limit,
                           config->quota_warning_threshold,
                           config->quota_emergency_threshold};
        auto pool = std::make_shared<KeyPoolManager>(
            config->api_keys, limits, pg,
            RotationPolicy(config->key_error_rotate_threshold),
            nullptr,
            static_cast<size_t>(config->key_identifier_chars));

        std::string stream = config->stream_keypool_events;
        pool->set_event_listener([redis, stream](const PoolEvent& event) {
            redis->publish_event(stream, event.to_json());
        });
        pool->initialize();

        auto executor = std::make_shared<RequestExecutor>(
            pool, std::make_shared<ApiErrorClassifier>());
        auto api = std::make_shared<ApiHttpClient>(
            config->api_base_url, config->api_key_param, config->request_timeout_ms);
        auto health = std::make_shared<HealthCheck>(redis, pg, pool);

        // Start HTTP server
        httplib::Server server;
        register_routes(server, pool, executor, api, health);

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            if (!server.listen(config->listen_addr.c_str(), config->listen_port)) {
                spdlog::error("HTTP server failed to listen on {}:{}",
                              config->listen_addr, config->listen_port);
                shutdown_requested = true;
            }
        });

        spdlog::info("Key pool service started");

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        server.stop();
        if (http_thread.joinable()) http_thread.join();

        curl_global_cleanup();
        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
