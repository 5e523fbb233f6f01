#include "ToolController.hpp"
#include "BatchFileReader.hpp"
#include "LineWindowReader.hpp"
#include "Log.hpp"
#include "PathResolver.hpp"
#include "ReadLimits.hpp"
#include "ToolError.hpp"
#include <filesystem>
#include <utility>

namespace {

const int kServerError = -32000;
const int kInvalidParams = -32602;
const int kMethodNotFound = -32601;

bool is_absent(const Json::Value& arguments, const char* field) {
    return !arguments.isMember(field) || arguments[field].isNull();
}

std::string required_string(const Json::Value& arguments, const char* field, const char* message) {
    if (is_absent(arguments, field) || !arguments[field].isString() ||
        trim_copy(arguments[field].asString()).empty()) {
        throw ToolError(ErrorKind::InvalidArgument, message);
    }
    return arguments[field].asString();
}

long long optional_integer(const Json::Value& arguments, const char* field, long long fallback, const char* message) {
    if (is_absent(arguments, field)) return fallback;
    const Json::Value& value = arguments[field];
    // isInt64() also accepts whole-number reals such as 2.0
    if (value.type() == Json::realValue || value.isBool() || !value.isInt64()) {
        throw ToolError(ErrorKind::InvalidArgument, message);
    }
    return value.asInt64();
}

std::string json_type_name(const Json::Value& value) {
    switch (value.type()) {
        case Json::nullValue: return "null";
        case Json::intValue:
        case Json::uintValue: return "integer";
        case Json::realValue: return "number";
        case Json::stringValue: return "string";
        case Json::booleanValue: return "boolean";
        case Json::arrayValue: return "array";
        case Json::objectValue: return "object";
    }
    return "unknown";
}

Json::Value text_result(const Json::Value& structured) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    Json::Value result;
    result["content"][0]["type"] = "text";
    result["content"][0]["text"] = Json::writeString(writer, structured);
    result["structuredContent"] = structured;
    return result;
}

Json::Value error_result(int code, const std::string& message, const char* kind, int status) {
    Json::Value result;
    result["__error__"] = message;
    result["__error_code__"] = code;
    result["__error_data__"]["kind"] = kind;
    result["__error_data__"]["status"] = status;
    return result;
}

Json::Value readLinesTool() {
    Json::Value tool;
    tool["name"] = "read_lines";
    tool["description"] = "Reads the lines of a file with a max bytes limit of 10MB. "
                          "Returns it as a list of strings in utf-8 encoding.";
    Json::Value& input = tool["inputSchema"];
    input["type"] = "object";
    input["properties"]["file_path"]["type"] = "string";
    input["properties"]["file_path"]["description"] = "File path to read lines, absolute or relative, required.";
    input["properties"]["file_encoding"]["type"] = "string";
    input["properties"]["file_encoding"]["description"] = "File encoding to read lines, optional, defaults to utf-8.";
    input["properties"]["file_encoding"]["default"] = kDefaultEncoding;
    input["properties"]["working_directory"]["type"] = "string";
    input["properties"]["working_directory"]["description"] =
        "Working directory to use for relative file paths, optional, defaults to current working directory.";
    input["properties"]["begin_line"]["type"] = "integer";
    input["properties"]["begin_line"]["description"] =
        "Beginning position to read from, optional, defaults to 1. Negative values indicate reading from the N to "
        "last line, e.g. -1 means last line, -2 means second to last line, etc.";
    input["properties"]["begin_line"]["default"] = static_cast<Json::Int64>(kDefaultBeginLine);
    input["properties"]["max_lines"]["type"] = "integer";
    input["properties"]["max_lines"]["description"] = "Maximum number of lines to read, optional, defaults to 200, max 10000.";
    input["properties"]["max_lines"]["minimum"] = 1;
    input["properties"]["max_lines"]["maximum"] = static_cast<Json::Int64>(kMaxLinesLimit);
    input["properties"]["max_lines"]["default"] = static_cast<Json::Int64>(kDefaultMaxLines);
    input["required"].append("file_path");

    Json::Value& output = tool["outputSchema"];
    output["type"] = "object";
    output["properties"]["file_path"]["type"] = "string";
    output["properties"]["file_path"]["description"] = "Resolved path of the file that was read.";
    output["properties"]["begin_line"]["type"] = "integer";
    output["properties"]["begin_line"]["description"] = "The begin_line argument as given.";
    output["properties"]["num_lines"]["type"] = "integer";
    output["properties"]["num_lines"]["description"] = "Number of lines read from the file.";
    output["properties"]["content_lines"]["type"] = "array";
    output["properties"]["content_lines"]["items"]["type"] = "string";
    output["properties"]["content_lines"]["description"] = "Content lines of the file as a list of strings in utf-8 encoding.";
    output["required"].append("file_path");
    output["required"].append("begin_line");
    output["required"].append("num_lines");
    output["required"].append("content_lines");
    return tool;
}

Json::Value readFilesTool() {
    Json::Value tool;
    tool["name"] = "read_files";
    tool["description"] = "Reads all content of one or multiple files with a max size limit of 10MB per file. "
                          "Returns a content_list with the item of file_path and content in utf-8 encoding.";
    Json::Value& input = tool["inputSchema"];
    input["type"] = "object";
    input["properties"]["file_paths"]["type"] = "array";
    input["properties"]["file_paths"]["items"]["type"] = "string";
    input["properties"]["file_paths"]["minItems"] = 1;
    input["properties"]["file_paths"]["description"] = "File paths to read, absolute or relative, required.";
    input["properties"]["file_encodings"]["type"] = "array";
    input["properties"]["file_encodings"]["items"]["type"].append("string");
    input["properties"]["file_encodings"]["items"]["type"].append("null");
    input["properties"]["file_encodings"]["description"] =
        "File encodings to read, optional, empty or None to use utf-8 encoding for each file.";
    input["properties"]["skip_errors"]["type"] = "boolean";
    input["properties"]["skip_errors"]["default"] = true;
    input["properties"]["skip_errors"]["description"] = "Whether to skip errors when reading files, optional, defaults to True.";
    input["properties"]["working_directory"]["type"] = "string";
    input["properties"]["working_directory"]["description"] =
        "Working directory to use for relative file paths, optional, defaults to current working directory.";
    input["required"].append("file_paths");

    Json::Value& output = tool["outputSchema"];
    output["type"] = "object";
    Json::Value& list = output["properties"]["content_list"];
    list["type"] = "array";
    list["description"] = "Contents of the files that were read.";
    list["items"]["type"] = "object";
    list["items"]["properties"]["file_path"]["type"] = "string";
    list["items"]["properties"]["file_path"]["description"] = "Path to the file that was read.";
    list["items"]["properties"]["content"]["type"] = "string";
    list["items"]["properties"]["content"]["description"] = "Content of the file, in utf-8 encoding.";
    list["items"]["required"].append("file_path");
    list["items"]["required"].append("content");
    output["required"].append("content_list");
    return tool;
}

} // namespace

ToolController::ToolController(std::string defaultWorkingDirectory)
    : defaultWorkingDirectory_(std::move(defaultWorkingDirectory)) {
}

Json::Value ToolController::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value ToolController::createError(const Json::Value& id, int code, const std::string& message) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

Json::Value ToolController::createError(const Json::Value& id, int code, const std::string& message, const Json::Value& data) const {
    Json::Value response = createError(id, code, message);
    if (!data.isNull()) {
        response["error"]["data"] = data;
    }
    return response;
}

Json::Value ToolController::initializeResult() const {
    Json::Value result;
    result["protocolVersion"] = "2025-06-18";
    result["capabilities"]["tools"]["listChanged"] = false;
    result["serverInfo"]["name"] = "mcp-utilbox";
    result["serverInfo"]["version"] = "1.0.0";
    return result;
}

Json::Value ToolController::listTools() const {
    Json::Value tools(Json::arrayValue);
    tools.append(readLinesTool());
    tools.append(readFilesTool());
    Json::Value result;
    result["tools"] = tools;
    return result;
}

std::string ToolController::workingDirectoryArg(const Json::Value& arguments) const {
    if (!is_absent(arguments, "working_directory")) {
        return required_string(arguments, "working_directory", "Working directory must be a non-empty string");
    }
    if (!defaultWorkingDirectory_.empty()) {
        return defaultWorkingDirectory_;
    }
    // Captured per call so a later chdir is honored.
    return std::filesystem::current_path().generic_string();
}

Json::Value ToolController::readLines(const Json::Value& arguments) const {
    ReadRequest request;
    request.path = required_string(arguments, "file_path", "File path must be a non-empty string");
    if (!is_absent(arguments, "file_encoding")) {
        request.encoding = required_string(arguments, "file_encoding", "File encoding must be a non-empty string");
    }
    request.workingDirectory = workingDirectoryArg(arguments);
    request.startLine = optional_integer(arguments, "begin_line", kDefaultBeginLine,
                                         "Begin line must be a non-zero integer");
    request.maxLines = optional_integer(arguments, "max_lines", kDefaultMaxLines,
                                        "Max lines must be a positive integer between 1 and 10000");

    LineWindowResult window = read_line_window(request);

    Json::Value structured;
    structured["file_path"] = window.resolvedPath;
    structured["begin_line"] = static_cast<Json::Int64>(window.startLine);
    structured["num_lines"] = static_cast<Json::UInt64>(window.lineCount);
    structured["content_lines"] = Json::Value(Json::arrayValue);
    for (const auto& line : window.lines) {
        structured["content_lines"].append(line);
    }
    return text_result(structured);
}

Json::Value ToolController::readFiles(const Json::Value& arguments) const {
    const char* pathsMessage = "File paths must be a non-empty list of strings";
    if (is_absent(arguments, "file_paths") || !arguments["file_paths"].isArray() || arguments["file_paths"].empty()) {
        throw ToolError(ErrorKind::InvalidArgument, pathsMessage);
    }

    BatchReadRequest request;
    if (!is_absent(arguments, "skip_errors")) {
        if (!arguments["skip_errors"].isBool()) {
            throw ToolError(ErrorKind::InvalidArgument, "skip_errors must be a boolean");
        }
        request.skipErrors = arguments["skip_errors"].asBool();
    }
    request.workingDirectory = workingDirectoryArg(arguments);

    for (const auto& path : arguments["file_paths"]) {
        if (!path.isString() || trim_copy(path.asString()).empty()) {
            throw ToolError(ErrorKind::InvalidArgument, pathsMessage);
        }
        request.paths.push_back(path.asString());
    }

    // Anything other than an array means "default encoding for every file".
    if (!is_absent(arguments, "file_encodings") && arguments["file_encodings"].isArray()) {
        for (const auto& encoding : arguments["file_encodings"]) {
            if (encoding.isNull()) {
                request.encodings.emplace_back(std::monostate{});
            } else if (encoding.isString()) {
                request.encodings.emplace_back(encoding.asString());
            } else {
                request.encodings.emplace_back(InvalidEncoding{json_type_name(encoding)});
            }
        }
    }

    BatchReadResult batch = read_file_batch(request);

    Json::Value structured;
    structured["content_list"] = Json::Value(Json::arrayValue);
    for (const auto& file : batch.files) {
        Json::Value item;
        item["file_path"] = file.path;
        item["content"] = file.content;
        structured["content_list"].append(item);
    }
    return text_result(structured);
}

Json::Value ToolController::callTool(const Json::Value& params) const {
    if (!params.isObject() || !params["name"].isString()) {
        return error_result(kInvalidParams, "Tool name must be a string", error_kind_name(ErrorKind::InvalidArgument),
                            error_kind_status(ErrorKind::InvalidArgument));
    }
    std::string toolName = params["name"].asString();
    Json::Value arguments = params.get("arguments", Json::Value(Json::objectValue));
    if (arguments.isNull()) {
        arguments = Json::Value(Json::objectValue);
    }
    if (!arguments.isObject()) {
        return error_result(kInvalidParams, "Tool arguments must be an object", error_kind_name(ErrorKind::InvalidArgument),
                            error_kind_status(ErrorKind::InvalidArgument));
    }

    try {
        if (toolName == "read_lines") {
            return readLines(arguments);
        } else if (toolName == "read_files") {
            return readFiles(arguments);
        }
        return error_result(kInvalidParams, "Unknown tool: " + toolName, error_kind_name(ErrorKind::NotFound),
                            error_kind_status(ErrorKind::NotFound));
    } catch (const ToolError& e) {
        log_debug("Tool '" + toolName + "' failed: " + e.what());
        return error_result(kServerError, e.what(), error_kind_name(e.kind()), e.status());
    } catch (const std::exception& e) {
        log_error("Tool '" + toolName + "' failed: " + e.what());
        return error_result(kServerError, std::string("Error: ") + e.what(), error_kind_name(ErrorKind::Internal),
                            error_kind_status(ErrorKind::Internal));
    }
}

Json::Value ToolController::toolResponse(const Json::Value& id, const Json::Value& result) const {
    if (result.isMember("__error__")) {
        return createError(id, result.get("__error_code__", kServerError).asInt(), result["__error__"].asString(),
                           result["__error_data__"]);
    }
    return createResponse(id, result);
}

Json::Value ToolController::handleRequest(const Json::Value& request) const {
    if (!request.isObject() || !request["method"].isString()) {
        return createError(request.isObject() ? request["id"] : Json::Value(), -32600, "Invalid Request");
    }
    std::string method = request["method"].asString();
    Json::Value id = request["id"];
    Json::Value params = request["params"];

    // Notifications carry no id and get no response
    bool notification = !request.isMember("id");

    if (method == "initialize") {
        return createResponse(id, initializeResult());
    } else if (method == "tools/list") {
        return createResponse(id, listTools());
    } else if (method == "tools/call") {
        return toolResponse(id, callTool(params));
    } else if (method == "ping") {
        return createResponse(id, Json::Value(Json::objectValue));
    } else if (notification) {
        return Json::Value();
    }
    return createError(id, kMethodNotFound, "Method not found: " + method);
}
