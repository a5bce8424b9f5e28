// DIRGATE - RPC Commands Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/rpc/commands.h"
#include "dirgate/core/encoding.h"
#include "dirgate/util/logging.h"
#include "dirgate/util/time.h"

#include <map>
#include <optional>
#include <stdexcept>

namespace dirgate {
namespace rpc {

namespace {

/// Thrown by the param readers; turned into INVALID_PARAMS
class ParamError : public std::runtime_error {
public:
    explicit ParamError(const std::string& message) : std::runtime_error(message) {}
};

/// Named member of object params, or the positional entry of array params
const JSONValue& Param(const RPCRequest& req, const std::string& name, size_t index) {
    const JSONValue& params = req.GetParams();
    if (params.IsObject()) return params[name];
    if (params.IsArray()) return params[index];
    return JSONValue::Null();
}

std::string StringParam(const RPCRequest& req, const std::string& name, size_t index) {
    const JSONValue& value = Param(req, name, index);
    if (value.IsNull()) return {};
    if (!value.IsString()) {
        throw ParamError("Parameter '" + name + "' must be a string");
    }
    return value.GetString();
}

std::optional<bool> BoolParam(const RPCRequest& req, const std::string& name, size_t index) {
    const JSONValue& value = Param(req, name, index);
    if (value.IsNull()) return std::nullopt;
    if (!value.IsBool()) {
        throw ParamError("Parameter '" + name + "' must be a boolean");
    }
    return value.GetBool();
}

std::optional<size_t> CountParam(const RPCRequest& req, const std::string& name, size_t index) {
    const JSONValue& value = Param(req, name, index);
    if (value.IsNull()) return std::nullopt;
    if (!value.IsInt() || value.GetInt() < 0) {
        throw ParamError("Parameter '" + name + "' must be a non-negative integer");
    }
    return static_cast<size_t>(value.GetInt());
}

JSONValue EntriesToJSON(const std::vector<FileEntry>& entries) {
    JSONValue::Array array;
    array.reserve(entries.size());
    for (const auto& entry : entries) {
        array.push_back(FileEntryToJSON(entry));
    }
    return JSONValue(std::move(array));
}

/// Run a handler body, mapping param errors to INVALID_PARAMS
template<typename Body>
RPCResponse WithParams(const RPCRequest& req, Body body) {
    try {
        return body();
    } catch (const ParamError& e) {
        return InvalidParams(e.what(), req.GetId());
    }
}

} // namespace

// ============================================================================
// Helper Functions Implementation
// ============================================================================

int ErrorKindToCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return ErrorCode::INVALID_PARAMS;
        case ErrorKind::NotFound:     return ErrorCode::NOT_FOUND;
        case ErrorKind::AccessDenied: return ErrorCode::ACCESS_DENIED;
        case ErrorKind::RateLimited:  return ErrorCode::RATE_LIMITED;
        case ErrorKind::None:
        case ErrorKind::Internal:
            break;
    }
    return ErrorCode::INTERNAL_ERROR;
}

RPCResponse FailureResponse(ErrorKind kind, const std::string& message, const JSONValue& id) {
    JSONValue data;
    data["kind"] = ErrorKindToString(kind);
    return RPCResponse::Error(ErrorKindToCode(kind), message, id, data);
}

JSONValue FileEntryToJSON(const FileEntry& entry) {
    JSONValue::Object obj;
    obj["name"] = entry.name;
    obj["path"] = entry.absolutePath;
    obj["size"] = entry.sizeBytes;
    obj["modified"] = util::FormatISO8601(entry.lastModified);
    obj["isDirectory"] = entry.isDirectory;
    return JSONValue(std::move(obj));
}

// ============================================================================
// RPCCommandTable Implementation
// ============================================================================

RPCCommandTable::RPCCommandTable(gateway::Gateway& gateway)
    : gateway_(gateway), startTime_(std::chrono::steady_clock::now()) {
    RegisterFileCommands();
    RegisterUtilityCommands();
}

void RPCCommandTable::RegisterCommands(RPCServer& server) {
    for (const auto& cmd : commands_) {
        server.RegisterMethod(cmd);
    }
    LOG_INFO(util::LogCategory::RPC) << "Registered " << commands_.size() << " RPC commands";
}

int64_t RPCCommandTable::GetUptime() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
}

void RPCCommandTable::RegisterFileCommands() {
    RPCCommandTable* table = this;

    commands_.push_back({
        "files.list",
        Category::FILES,
        "List the files and directories in a directory under the root.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_files_list(req, ctx, table);
        },
        {"path"},
        {"Directory to list (optional, defaults to the root)"}
    });

    commands_.push_back({
        "files.defaultpath",
        Category::FILES,
        "Returns the root directory served by the gateway.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_files_defaultpath(req, ctx, table);
        },
        {},
        {}
    });

    commands_.push_back({
        "files.search",
        Category::FILES,
        "Find files and directories whose name contains a term.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_files_search(req, ctx, table);
        },
        {"path", "term", "includeSubdirectories", "maxResults"},
        {"Directory to search",
         "Case-insensitive name fragment",
         "Descend into subdirectories (optional, default true)",
         "Result limit (optional, capped by the server)"}
    });

    commands_.push_back({
        "files.download",
        Category::FILES,
        "Read a file. Returns base64 content with its SHA-256.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_files_download(req, ctx, table);
        },
        {"path"},
        {"File to read"}
    });

    commands_.push_back({
        "files.upload",
        Category::FILES,
        "Store a file in a directory after validating name, type and content.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_files_upload(req, ctx, table);
        },
        {"path", "fileName", "contentType", "data"},
        {"Destination directory",
         "Client-supplied file name",
         "Declared MIME type",
         "Base64 encoded content"}
    });

    commands_.push_back({
        "files.copy",
        Category::FILES,
        "Copy a file, replacing the destination if it exists.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_files_copy(req, ctx, table);
        },
        {"sourcePath", "destinationPath"},
        {"File to copy", "Destination file path"}
    });

    commands_.push_back({
        "files.move",
        Category::FILES,
        "Move a file. A directory destination keeps the file name.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_files_move(req, ctx, table);
        },
        {"sourcePath", "destinationPath"},
        {"File to move", "Destination file or directory"}
    });
}

void RPCCommandTable::RegisterUtilityCommands() {
    RPCCommandTable* table = this;

    commands_.push_back({
        "help",
        Category::UTILITY,
        "List all commands, or get help for a specified command.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_help(req, ctx, table);
        },
        {"command"},
        {"The command to get help for (optional)"}
    });

    commands_.push_back({
        "uptime",
        Category::UTILITY,
        "Returns the total uptime of the server in seconds.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_uptime(req, ctx, table);
        },
        {},
        {}
    });
}

// ============================================================================
// File Commands
// ============================================================================

RPCResponse cmd_files_list(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table) {
    return WithParams(req, [&]() {
        auto result = table->GetGateway().List(ctx.clientAddress, StringParam(req, "path", 0));
        if (!result) {
            return FailureResponse(result.Error(), result.Message(), req.GetId());
        }

        const auto& payload = result.Value();
        JSONValue::Object obj;
        obj["directory"] = payload.directory;
        obj["entries"] = EntriesToJSON(payload.entries);
        return RPCResponse::Success(JSONValue(std::move(obj)), req.GetId());
    });
}

RPCResponse cmd_files_defaultpath(const RPCRequest& req, const RPCContext& /*ctx*/,
                                  RPCCommandTable* table) {
    JSONValue::Object obj;
    obj["path"] = table->GetGateway().DefaultPath();
    return RPCResponse::Success(JSONValue(std::move(obj)), req.GetId());
}

RPCResponse cmd_files_search(const RPCRequest& req, const RPCContext& ctx,
                             RPCCommandTable* table) {
    return WithParams(req, [&]() {
        gateway::SearchParams params;
        params.path = StringParam(req, "path", 0);
        params.term = StringParam(req, "term", 1);
        params.includeSubdirectories = BoolParam(req, "includeSubdirectories", 2).value_or(true);
        params.maxResults = CountParam(req, "maxResults", 3);

        auto result = table->GetGateway().Search(ctx.clientAddress, params);
        if (!result) {
            return FailureResponse(result.Error(), result.Message(), req.GetId());
        }

        const auto& payload = result.Value();
        JSONValue::Object obj;
        obj["directory"] = payload.directory;
        obj["entries"] = EntriesToJSON(payload.entries);
        obj["count"] = static_cast<uint64_t>(payload.entries.size());
        obj["truncated"] = payload.truncated;
        obj["timedOut"] = payload.timedOut;
        obj["skippedDirectories"] = static_cast<uint64_t>(payload.skippedDirectories);
        obj["vanishedDirectories"] = static_cast<uint64_t>(payload.vanishedDirectories);
        obj["message"] = payload.message;
        return RPCResponse::Success(JSONValue(std::move(obj)), req.GetId());
    });
}

RPCResponse cmd_files_download(const RPCRequest& req, const RPCContext& ctx,
                               RPCCommandTable* table) {
    return WithParams(req, [&]() {
        auto result = table->GetGateway().Download(ctx.clientAddress, StringParam(req, "path", 0));
        if (!result) {
            return FailureResponse(result.Error(), result.Message(), req.GetId());
        }

        const auto& payload = result.Value();
        JSONValue::Object obj;
        obj["fileName"] = payload.fileName;
        obj["contentType"] = payload.contentType;
        obj["size"] = static_cast<uint64_t>(payload.data.size());
        obj["data"] = Base64Encode(payload.data);
        obj["sha256"] = Sha256Hex(payload.data);
        return RPCResponse::Success(JSONValue(std::move(obj)), req.GetId());
    });
}

RPCResponse cmd_files_upload(const RPCRequest& req, const RPCContext& ctx,
                             RPCCommandTable* table) {
    return WithParams(req, [&]() {
        gateway::UploadParams params;
        params.directory = StringParam(req, "path", 0);
        params.fileName = StringParam(req, "fileName", 1);
        params.contentType = StringParam(req, "contentType", 2);

        auto decoded = Base64Decode(StringParam(req, "data", 3));
        if (!decoded) {
            return InvalidParams("Parameter 'data' is not valid base64", req.GetId());
        }
        params.data = std::move(*decoded);

        auto result = table->GetGateway().Upload(ctx.clientAddress, params);
        if (!result) {
            return FailureResponse(result.Error(), result.Message(), req.GetId());
        }

        const auto& payload = result.Value();
        JSONValue::Object obj;
        obj["fileName"] = payload.fileName;
        obj["size"] = payload.sizeBytes;
        obj["path"] = payload.path;
        return RPCResponse::Success(JSONValue(std::move(obj)), req.GetId());
    });
}

namespace {

using TransferCall = OperationResult<gateway::TransferPayload>
    (gateway::Gateway::*)(const std::string&, const std::string&, const std::string&);

RPCResponse RunTransfer(const RPCRequest& req, const RPCContext& ctx,
                        RPCCommandTable* table, TransferCall call) {
    return WithParams(req, [&]() {
        auto result = (table->GetGateway().*call)(ctx.clientAddress,
                                                 StringParam(req, "sourcePath", 0),
                                                 StringParam(req, "destinationPath", 1));
        if (!result) {
            return FailureResponse(result.Error(), result.Message(), req.GetId());
        }

        JSONValue::Object obj;
        obj["destination"] = result.Value().destination;
        return RPCResponse::Success(JSONValue(std::move(obj)), req.GetId());
    });
}

} // namespace

RPCResponse cmd_files_copy(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table) {
    return RunTransfer(req, ctx, table, &gateway::Gateway::Copy);
}

RPCResponse cmd_files_move(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table) {
    return RunTransfer(req, ctx, table, &gateway::Gateway::Move);
}

// ============================================================================
// Utility Commands
// ============================================================================

RPCResponse cmd_help(const RPCRequest& req, const RPCContext& /*ctx*/,
                     RPCCommandTable* table) {
    return WithParams(req, [&]() {
        std::string command = StringParam(req, "command", 0);

        if (command.empty()) {
            std::map<std::string, JSONValue::Array> byCategory;
            for (const auto& cmd : table->GetAllCommands()) {
                JSONValue::Object info;
                info["name"] = cmd.name;
                info["description"] = cmd.description;
                byCategory[cmd.category].push_back(JSONValue(std::move(info)));
            }

            JSONValue::Object result;
            for (auto& [category, cmds] : byCategory) {
                result[category] = JSONValue(std::move(cmds));
            }
            return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
        }

        for (const auto& cmd : table->GetAllCommands()) {
            if (cmd.name != command) continue;

            JSONValue::Object result;
            result["name"] = cmd.name;
            result["category"] = cmd.category;
            result["description"] = cmd.description;

            JSONValue::Array args;
            for (size_t i = 0; i < cmd.argNames.size(); ++i) {
                JSONValue::Object arg;
                arg["name"] = cmd.argNames[i];
                if (i < cmd.argDescriptions.size()) {
                    arg["description"] = cmd.argDescriptions[i];
                }
                args.push_back(JSONValue(std::move(arg)));
            }
            result["arguments"] = JSONValue(std::move(args));
            return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
        }

        return InvalidParams("Unknown command: " + command, req.GetId());
    });
}

RPCResponse cmd_uptime(const RPCRequest& req, const RPCContext& /*ctx*/,
                       RPCCommandTable* table) {
    return RPCResponse::Success(JSONValue(table->GetUptime()), req.GetId());
}

} // namespace rpc
} // namespace dirgate
