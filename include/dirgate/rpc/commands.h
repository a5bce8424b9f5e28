// DIRGATE - RPC Commands
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// JSON-RPC method table for the gateway. Handlers translate JSON params
// into gateway calls and gateway results into JSON results or errors.

#ifndef DIRGATE_RPC_COMMANDS_H
#define DIRGATE_RPC_COMMANDS_H

#include "dirgate/core/types.h"
#include "dirgate/gateway/gateway.h"
#include "dirgate/rpc/server.h"

#include <chrono>
#include <string>
#include <vector>

namespace dirgate {
namespace rpc {

namespace Category {
    constexpr const char* FILES = "files";
    constexpr const char* UTILITY = "utility";
}

// ============================================================================
// Command Table
// ============================================================================

class RPCCommandTable {
public:
    /// @param gateway Must outlive the table and every server it registers with
    explicit RPCCommandTable(gateway::Gateway& gateway);

    RPCCommandTable(const RPCCommandTable&) = delete;
    RPCCommandTable& operator=(const RPCCommandTable&) = delete;

    /// Register all commands with the server
    void RegisterCommands(RPCServer& server);

    const std::vector<RPCMethod>& GetAllCommands() const { return commands_; }

    gateway::Gateway& GetGateway() const { return gateway_; }

    /// Seconds since the table was created
    int64_t GetUptime() const;

private:
    void RegisterFileCommands();
    void RegisterUtilityCommands();

    gateway::Gateway& gateway_;
    std::vector<RPCMethod> commands_;
    std::chrono::steady_clock::time_point startTime_;
};

// ============================================================================
// Helpers
// ============================================================================

/// JSON-RPC error code for a gateway failure kind
int ErrorKindToCode(ErrorKind kind);

/// Error response carrying the gateway's message
RPCResponse FailureResponse(ErrorKind kind, const std::string& message, const JSONValue& id);

JSONValue FileEntryToJSON(const FileEntry& entry);

// ============================================================================
// Command Handlers
// ============================================================================

RPCResponse cmd_files_list(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table);
RPCResponse cmd_files_defaultpath(const RPCRequest& req, const RPCContext& ctx,
                                  RPCCommandTable* table);
RPCResponse cmd_files_search(const RPCRequest& req, const RPCContext& ctx,
                             RPCCommandTable* table);
RPCResponse cmd_files_download(const RPCRequest& req, const RPCContext& ctx,
                               RPCCommandTable* table);
RPCResponse cmd_files_upload(const RPCRequest& req, const RPCContext& ctx,
                             RPCCommandTable* table);
RPCResponse cmd_files_copy(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table);
RPCResponse cmd_files_move(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table);

RPCResponse cmd_help(const RPCRequest& req, const RPCContext& ctx,
                     RPCCommandTable* table);
RPCResponse cmd_uptime(const RPCRequest& req, const RPCContext& ctx,
                       RPCCommandTable* table);

} // namespace rpc
} // namespace dirgate

#endif // DIRGATE_RPC_COMMANDS_H
