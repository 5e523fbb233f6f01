#pragma once
#include <json/json.h>
#include <string>

class ToolController {
public:
    // defaultWorkingDirectory is used when a call omits working_directory; when it
    // is empty the process working directory is captured per call.
    explicit ToolController(std::string defaultWorkingDirectory = std::string());

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message, const Json::Value& data) const;

    Json::Value initializeResult() const;
    Json::Value listTools() const;

    // Call tool by name. On failure the returned value carries "__error__" (message),
    // "__error_code__" (JSON-RPC code) and "__error_data__" ({kind, status}).
    Json::Value callTool(const Json::Value& params) const;

    // Wrap a callTool result as a JSON-RPC response or error.
    Json::Value toolResponse(const Json::Value& id, const Json::Value& result) const;

    // Dispatch one parsed JSON-RPC message. Returns null for notifications.
    Json::Value handleRequest(const Json::Value& request) const;

private:
    Json::Value readLines(const Json::Value& arguments) const;
    Json::Value readFiles(const Json::Value& arguments) const;
    std::string workingDirectoryArg(const Json::Value& arguments) const;

    std::string defaultWorkingDirectory_;
};
