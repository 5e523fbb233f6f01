#include <iostream>
#include <string>
#include <sstream>
#include <json/json.h>
#include "Log.hpp"
#include "ServerConfig.hpp"
#include "ToolController.hpp"

namespace {

void writeMessage(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output, one message per line
    std::cout << Json::writeString(writer, message) << std::endl;
}

void processRequest(const ToolController& controller, const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(line);
    if (!Json::parseFromStream(builder, iss, &request, &errs)) {
        log_error("JSON parse error: " + errs);
        writeMessage(controller.createError(Json::Value(), -32700, "Parse error"));
        return;
    }

    Json::Value response = controller.handleRequest(request);
    if (!response.isNull()) {
        writeMessage(response);
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = argc > 1 ? argv[1] : "config.json";
    ServerConfig config = load_server_config(configPath);
    ToolController controller(config.workingDirectory);

    log_info("Starting MCP server using stdio transport.");

    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty()) {
            processRequest(controller, line);
        }
    }

    return 0;
}
