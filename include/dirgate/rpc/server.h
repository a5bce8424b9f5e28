// DIRGATE - RPC Server
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// JSON-RPC 2.0 over HTTP/1.1 for the gateway.
//
// Features:
// - Thread pool connection handling
// - Batches and notifications
// - Security response headers on every reply
// - Caller identification, optionally from proxy headers
// - Request size limits and suspicious request logging

#ifndef DIRGATE_RPC_SERVER_H
#define DIRGATE_RPC_SERVER_H

#include "dirgate/rpc/json.h"
#include "dirgate/util/threadpool.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dirgate {
namespace rpc {

// ============================================================================
// RPC Error Codes (JSON-RPC 2.0 standard + gateway)
// ============================================================================

namespace ErrorCode {
    // Standard JSON-RPC 2.0 errors
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;

    // Server errors (-32000 to -32099)
    constexpr int SERVER_ERROR = -32000;
    constexpr int SERVER_BUSY = -32001;
    constexpr int RATE_LIMITED = -32003;
    constexpr int NOT_FOUND = -32004;
    constexpr int ACCESS_DENIED = -32005;
}

/// Default JSON-RPC port
constexpr uint16_t DEFAULT_RPC_PORT = 8750;

/// Largest accepted request head (request line and headers)
constexpr size_t MAX_HTTP_HEADER_SIZE = 16 * 1024;

/// Body limit for uploads of maxFileSize bytes: base64 growth plus envelope
constexpr size_t MaxRequestSizeFor(uint64_t maxFileSize) {
    return static_cast<size_t>((maxFileSize + 2) / 3 * 4) + 64 * 1024;
}

// ============================================================================
// RPC Request
// ============================================================================

class RPCRequest {
public:
    RPCRequest() = default;
    RPCRequest(const std::string& method, const JSONValue& params = JSONValue(),
               const JSONValue& id = JSONValue(1));

    const std::string& GetMethod() const { return method_; }
    const JSONValue& GetParams() const { return params_; }
    const JSONValue& GetId() const { return id_; }

    /// True when the request carried no "id" member
    bool IsNotification() const { return notification_; }

    /// Named parameter; null when params is not an object or lacks the key
    const JSONValue& GetParam(const std::string& name) const;
    bool HasParam(const std::string& name) const;

    std::string ToJSON() const;

    /// Validate a request object; nullopt if it is not a JSON-RPC 2.0 request
    static std::optional<RPCRequest> FromJSON(const JSONValue& value);

private:
    std::string method_;
    JSONValue params_;
    JSONValue id_;
    bool notification_{false};
};

// ============================================================================
// RPC Response
// ============================================================================

class RPCResponse {
public:
    static RPCResponse Success(const JSONValue& result, const JSONValue& id);
    static RPCResponse Error(int code, const std::string& message,
                             const JSONValue& id, const JSONValue& data = JSONValue());

    bool IsError() const { return isError_; }
    const JSONValue& GetResult() const { return result_; }
    int GetErrorCode() const { return errorCode_; }
    const std::string& GetErrorMessage() const { return errorMessage_; }
    const JSONValue& GetErrorData() const { return errorData_; }
    const JSONValue& GetId() const { return id_; }

    JSONValue ToValue() const;
    std::string ToJSON() const { return ToValue().ToJSON(); }

private:
    bool isError_{false};
    JSONValue result_;
    int errorCode_{0};
    std::string errorMessage_;
    JSONValue errorData_;
    JSONValue id_;
};

// ============================================================================
// RPC Method Handler
// ============================================================================

/// Per-request information available to handlers
struct RPCContext {
    /// Caller id used for rate limiting and audit logs
    std::string clientAddress;
};

using RPCHandler = std::function<RPCResponse(const RPCRequest&, const RPCContext&)>;

struct RPCMethod {
    std::string name;
    std::string category;
    std::string description;
    RPCHandler handler;
    std::vector<std::string> argNames;
    std::vector<std::string> argDescriptions;
};

// ============================================================================
// HTTP Messages
// ============================================================================

struct HTTPRequest {
    std::string method;
    std::string target;
    std::string version;
    std::map<std::string, std::string> headers;   // Lowercase names
    size_t contentLength{0};
    std::string body;

    /// Header value or empty
    std::string Header(const std::string& lowercaseName) const;
};

struct HTTPReply {
    int status{200};
    std::string body;
    std::string contentType{"application/json"};
    std::map<std::string, std::string> extraHeaders;
};

// ============================================================================
// RPC Server Configuration
// ============================================================================

struct RPCServerConfig {
    std::string bindAddress{"127.0.0.1"};
    uint16_t port{DEFAULT_RPC_PORT};

    /// Worker threads handling connections
    size_t threadPoolSize{4};

    /// Queued connections before new ones are refused with 503
    size_t maxConnections{128};

    /// Max request body size (bytes)
    size_t maxRequestSize{MaxRequestSizeFor(10 * 1024 * 1024)};

    /// Socket receive timeout (seconds)
    int requestTimeout{30};

    /// Take the caller id from X-Forwarded-For / X-Real-IP
    bool trustProxy{false};
};

// ============================================================================
// RPC Server
// ============================================================================

class RPCServer {
public:
    RPCServer();
    explicit RPCServer(const RPCServerConfig& config);
    ~RPCServer();

    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;

    const RPCServerConfig& GetConfig() const { return config_; }

    // === Server Control ===

    /// Bind, listen and start accepting. Returns false if the socket setup fails.
    bool Start();

    /// Stop accepting and wait for in-flight connections
    void Stop();

    bool IsRunning() const { return running_.load(); }

    /// Port actually bound (useful when configured with port 0)
    uint16_t BoundPort() const { return boundPort_; }

    // === Method Registration ===

    void RegisterMethod(const RPCMethod& method);
    void UnregisterMethod(const std::string& name);
    bool HasMethod(const std::string& name) const;

    /// All methods sorted by category then name
    std::vector<RPCMethod> GetMethods() const;

    // === Request Handling ===

    RPCResponse HandleRequest(const RPCRequest& request, const RPCContext& context);

    /// Handle a JSON body; empty string when nothing needs answering
    std::string HandleRawRequest(const std::string& json, const RPCContext& context);

    /// Full HTTP handling for one parsed request from peerAddress
    HTTPReply HandleHTTPRequest(const HTTPRequest& request, const std::string& peerAddress);

    // === Statistics ===

    int64_t GetUptime() const;
    uint64_t TotalRequests() const { return totalRequests_.load(); }
    uint64_t TotalErrors() const { return totalErrors_.load(); }
    size_t ActiveConnections() const { return activeConnections_.load(); }

    // === HTTP Helpers ===

    /// Parse the request line and headers (everything before the blank line)
    static std::optional<HTTPRequest> ParseHTTPHead(const std::string& head);

    /// Serialize a reply with the security headers
    static std::string BuildHTTPResponse(const HTTPReply& reply);

    /// Caller id: the peer, or the first proxy-supplied address when trusted
    static std::string ResolveCallerId(const HTTPRequest& request,
                                       const std::string& peerAddress,
                                       bool trustProxy);

    /// Pattern matched by the suspicious request detector, or empty
    static std::string FindSuspiciousPattern(const std::string& text);

private:
    struct DispatchResult {
        std::vector<RPCResponse> responses;
        bool batch{false};
    };

    DispatchResult Dispatch(const std::string& json, const RPCContext& context);

    void HTTPServerThread();
    void HandleConnection(int clientSocket, std::string peerAddress);

    RPCServerConfig config_;

    std::map<std::string, RPCMethod> methods_;
    mutable std::mutex methodsMutex_;

    std::atomic<bool> running_{false};
    int serverSocket_{-1};
    uint16_t boundPort_{0};
    std::thread httpThread_;
    std::unique_ptr<util::ThreadPool> threadPool_;

    std::chrono::steady_clock::time_point startTime_;
    std::atomic<uint64_t> totalRequests_{0};
    std::atomic<uint64_t> totalErrors_{0};
    std::atomic<size_t> activeConnections_{0};
};

// ============================================================================
// Helper Functions
// ============================================================================

inline RPCResponse ParseError(const JSONValue& id = JSONValue()) {
    return RPCResponse::Error(ErrorCode::PARSE_ERROR, "Parse error", id);
}

inline RPCResponse InvalidRequest(const JSONValue& id = JSONValue()) {
    return RPCResponse::Error(ErrorCode::INVALID_REQUEST, "Invalid Request", id);
}

inline RPCResponse MethodNotFound(const std::string& method, const JSONValue& id) {
    return RPCResponse::Error(ErrorCode::METHOD_NOT_FOUND, "Method not found: " + method, id);
}

inline RPCResponse InvalidParams(const std::string& message, const JSONValue& id) {
    return RPCResponse::Error(ErrorCode::INVALID_PARAMS, message, id);
}

inline RPCResponse InternalError(const std::string& message, const JSONValue& id) {
    return RPCResponse::Error(ErrorCode::INTERNAL_ERROR, message, id);
}

} // namespace rpc
} // namespace dirgate

#endif // DIRGATE_RPC_SERVER_H
