#include <drogon/drogon.h>
#include <functional>
#include <json/json.h>
#include <memory>
#include <string>
#include "Log.hpp"
#include "ServerConfig.hpp"
#include "ToolController.hpp"

namespace {

std::shared_ptr<const ToolController> controller;

// Main HTTP handler for MCP JSON-RPC requests
void handleMcpRequest(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto json = req->getJsonObject();
    if (!json) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(
            controller->createError(Json::Value::null, -32700, "Parse error"));
        resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
        callback(resp);
        return;
    }

    Json::Value response = controller->handleRequest(*json);
    if (response.isNull()) {
        // Notifications are acknowledged without a body
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::HttpStatusCode::k202Accepted);
        callback(resp);
        return;
    }
    callback(drogon::HttpResponse::newHttpJsonResponse(response));
}

} // namespace

int main(int argc, char** argv) {
    using namespace drogon;

    std::string configPath = argc > 1 ? argv[1] : "config.json";
    ServerConfig config = load_server_config(configPath);
    controller = std::make_shared<const ToolController>(config.workingDirectory);

    // HTTP JSON-RPC endpoint
    app().registerHandler("/mcp",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleMcpRequest(req, std::move(callback));
        },
        {Post});

    // CORS support
    app().registerPreHandlingAdvice([](const HttpRequestPtr& req, AdviceCallback&& respond, AdviceChainCallback&& next) {
        if (req->method() == Options) {
            auto resp = HttpResponse::newHttpResponse();
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
            respond(resp);
            return;
        }
        next();
    });

    app().registerPostHandlingAdvice([](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
    });

    app().addListener(config.host, static_cast<uint16_t>(config.port));

    log_info("Starting MCP server on " + config.host + ":" + std::to_string(config.port) + " using HTTP transport.");
    log_info("  HTTP endpoint: http://" + config.host + ":" + std::to_string(config.port) + "/mcp");
    app().run();

    return 0;
}
