// DIRGATE - RPC Server Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/rpc/server.h"
#include "dirgate/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace dirgate {
namespace rpc {

namespace {

constexpr size_t READ_CHUNK = 4096;

/// Patterns logged as likely probing; matched case-insensitively
const char* const SUSPICIOUS_PATTERNS[] = {
    "../", "..\\", "%2e%2e", "%252e%252e",
    "<script", "javascript:", "vbscript:",
    "union select", " or 1=1", "' or '1'='1",
    "/etc/passwd", "/proc/", "cmd.exe", "powershell",
};

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string Trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && (text[begin] == ' ' || text[begin] == '\t')) ++begin;
    while (end > begin && (text[end - 1] == ' ' || text[end - 1] == '\t' ||
                           text[end - 1] == '\r')) --end;
    return text.substr(begin, end - begin);
}

const char* StatusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

/// Closes the client socket and maintains the active connection count
class ConnectionGuard {
public:
    ConnectionGuard(int socket, std::atomic<size_t>& counter)
        : socket_(socket), counter_(counter) {
        ++counter_;
    }
    ~ConnectionGuard() {
        close(socket_);
        --counter_;
    }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

private:
    int socket_;
    std::atomic<size_t>& counter_;
};

bool SendAll(int socket, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

/// Append up to READ_CHUNK bytes; false on EOF, timeout or error
bool ReceiveChunk(int socket, std::string& buffer) {
    char chunk[READ_CHUNK];
    while (true) {
        ssize_t n = recv(socket, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) continue;
        return false;
    }
}

HTTPReply ErrorReply(int status, int code, const std::string& message) {
    HTTPReply reply;
    reply.status = status;
    reply.body = RPCResponse::Error(code, message, JSONValue()).ToJSON();
    return reply;
}

} // namespace

// ============================================================================
// RPCRequest Implementation
// ============================================================================

RPCRequest::RPCRequest(const std::string& method, const JSONValue& params,
                       const JSONValue& id)
    : method_(method), params_(params), id_(id) {}

const JSONValue& RPCRequest::GetParam(const std::string& name) const {
    return params_.IsObject() ? params_[name] : JSONValue::Null();
}

bool RPCRequest::HasParam(const std::string& name) const {
    return params_.IsObject() && params_.HasKey(name) && !params_[name].IsNull();
}

std::string RPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = "2.0";
    obj["method"] = method_;
    if (!params_.IsNull()) {
        obj["params"] = params_;
    }
    if (!notification_) {
        obj["id"] = id_;
    }
    return JSONValue(std::move(obj)).ToJSON();
}

std::optional<RPCRequest> RPCRequest::FromJSON(const JSONValue& value) {
    if (!value.IsObject()) return std::nullopt;

    const JSONValue& version = value["jsonrpc"];
    if (!version.IsString() || version.GetString() != "2.0") return std::nullopt;
    if (!value["method"].IsString()) return std::nullopt;

    const JSONValue& params = value["params"];
    if (!params.IsNull() && !params.IsObject() && !params.IsArray()) return std::nullopt;

    const JSONValue& id = value["id"];
    if (!id.IsNull() && !id.IsString() && !id.IsNumber()) return std::nullopt;

    RPCRequest request;
    request.method_ = value["method"].GetString();
    request.params_ = params;
    request.id_ = id;
    request.notification_ = !value.HasKey("id");
    return request;
}

// ============================================================================
// RPCResponse Implementation
// ============================================================================

RPCResponse RPCResponse::Success(const JSONValue& result, const JSONValue& id) {
    RPCResponse resp;
    resp.result_ = result;
    resp.id_ = id;
    return resp;
}

RPCResponse RPCResponse::Error(int code, const std::string& message,
                               const JSONValue& id, const JSONValue& data) {
    RPCResponse resp;
    resp.isError_ = true;
    resp.errorCode_ = code;
    resp.errorMessage_ = message;
    resp.errorData_ = data;
    resp.id_ = id;
    return resp;
}

JSONValue RPCResponse::ToValue() const {
    JSONValue obj;
    obj["jsonrpc"] = "2.0";
    if (isError_) {
        JSONValue error;
        error["code"] = errorCode_;
        error["message"] = errorMessage_;
        if (!errorData_.IsNull()) {
            error["data"] = errorData_;
        }
        obj["error"] = std::move(error);
    } else {
        obj["result"] = result_;
    }
    obj["id"] = id_;
    return obj;
}

// ============================================================================
// HTTP Helpers
// ============================================================================

std::string HTTPRequest::Header(const std::string& lowercaseName) const {
    auto it = headers.find(lowercaseName);
    return it == headers.end() ? std::string() : it->second;
}

std::optional<HTTPRequest> RPCServer::ParseHTTPHead(const std::string& head) {
    std::istringstream stream(head);
    std::string line;
    if (!std::getline(stream, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    HTTPRequest request;
    std::istringstream requestLine(line);
    if (!(requestLine >> request.method >> request.target >> request.version)) {
        return std::nullopt;
    }
    if (request.version.compare(0, 5, "HTTP/") != 0) return std::nullopt;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return std::nullopt;
        request.headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
    }

    const std::string length = request.Header("content-length");
    if (!length.empty()) {
        if (length.size() > 19 ||
            !std::all_of(length.begin(), length.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
        request.contentLength = static_cast<size_t>(std::stoull(length));
    }
    return request;
}

std::string RPCServer::BuildHTTPResponse(const HTTPReply& reply) {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << reply.status << " " << StatusText(reply.status) << "\r\n";
    if (reply.status != 204) {
        ss << "Content-Type: " << reply.contentType << "\r\n";
        ss << "Content-Length: " << reply.body.size() << "\r\n";
    }
    ss << "X-Frame-Options: DENY\r\n";
    ss << "X-Content-Type-Options: nosniff\r\n";
    ss << "X-XSS-Protection: 1; mode=block\r\n";
    ss << "Referrer-Policy: strict-origin-when-cross-origin\r\n";
    ss << "Content-Security-Policy: default-src 'none'; frame-ancestors 'none'\r\n";
    ss << "Cache-Control: no-store\r\n";
    for (const auto& [name, value] : reply.extraHeaders) {
        ss << name << ": " << value << "\r\n";
    }
    ss << "Connection: close\r\n";
    ss << "\r\n";
    if (reply.status != 204) {
        ss << reply.body;
    }
    return ss.str();
}

std::string RPCServer::ResolveCallerId(const HTTPRequest& request,
                                       const std::string& peerAddress,
                                       bool trustProxy) {
    if (trustProxy) {
        std::string forwarded = request.Header("x-forwarded-for");
        if (!forwarded.empty()) {
            std::string first = Trim(forwarded.substr(0, forwarded.find(',')));
            if (!first.empty()) return first;
        }
        std::string realIp = Trim(request.Header("x-real-ip"));
        if (!realIp.empty()) return realIp;
    }
    return peerAddress;
}

std::string RPCServer::FindSuspiciousPattern(const std::string& text) {
    const std::string lowered = ToLower(text);
    for (const char* pattern : SUSPICIOUS_PATTERNS) {
        if (lowered.find(pattern) != std::string::npos) {
            return pattern;
        }
    }
    return {};
}

// ============================================================================
// RPCServer Implementation
// ============================================================================

RPCServer::RPCServer() : startTime_(std::chrono::steady_clock::now()) {}

RPCServer::RPCServer(const RPCServerConfig& config)
    : config_(config), startTime_(std::chrono::steady_clock::now()) {}

RPCServer::~RPCServer() {
    Stop();
}

bool RPCServer::Start() {
    if (running_.load()) return true;

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (config_.bindAddress.empty() || config_.bindAddress == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, config_.bindAddress.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR(util::LogCategory::RPC) << "Invalid bind address: " << config_.bindAddress;
        return false;
    }

    serverSocket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (serverSocket_ < 0) {
        LOG_ERROR(util::LogCategory::RPC) << "Failed to create socket: " << std::strerror(errno);
        return false;
    }

    int opt = 1;
    if (setsockopt(serverSocket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
        LOG_WARN(util::LogCategory::RPC) << "SO_REUSEADDR failed: " << std::strerror(errno);
    }

    if (bind(serverSocket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR(util::LogCategory::RPC) << "Failed to bind to "
            << config_.bindAddress << ":" << config_.port << ": " << std::strerror(errno);
        close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    if (listen(serverSocket_, static_cast<int>(config_.maxConnections)) < 0) {
        LOG_ERROR(util::LogCategory::RPC) << "Failed to listen on socket: " << std::strerror(errno);
        close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    socklen_t addrLen = sizeof(addr);
    if (getsockname(serverSocket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) == 0) {
        boundPort_ = ntohs(addr.sin_port);
    } else {
        boundPort_ = config_.port;
    }

    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = config_.threadPoolSize > 0 ? config_.threadPoolSize : 4;
    poolConfig.maxQueueSize = config_.maxConnections;
    poolConfig.name = "rpc";
    poolConfig.startImmediately = true;
    threadPool_ = std::make_unique<util::ThreadPool>(poolConfig);

    running_.store(true);
    startTime_ = std::chrono::steady_clock::now();
    httpThread_ = std::thread(&RPCServer::HTTPServerThread, this);

    LOG_INFO(util::LogCategory::RPC) << "RPC server listening on "
        << config_.bindAddress << ":" << boundPort_
        << " with " << poolConfig.numThreads << " worker threads";
    return true;
}

void RPCServer::Stop() {
    if (!running_.exchange(false)) return;

    // shutdown() wakes the thread blocked in accept()
    if (serverSocket_ >= 0) {
        shutdown(serverSocket_, SHUT_RDWR);
        close(serverSocket_);
        serverSocket_ = -1;
    }

    if (httpThread_.joinable()) {
        httpThread_.join();
    }

    if (threadPool_) {
        threadPool_->Shutdown();
        threadPool_.reset();
    }

    LOG_INFO(util::LogCategory::RPC) << "RPC server stopped";
}

void RPCServer::RegisterMethod(const RPCMethod& method) {
    std::lock_guard<std::mutex> lock(methodsMutex_);
    methods_[method.name] = method;
}

void RPCServer::UnregisterMethod(const std::string& name) {
    std::lock_guard<std::mutex> lock(methodsMutex_);
    methods_.erase(name);
}

bool RPCServer::HasMethod(const std::string& name) const {
    std::lock_guard<std::mutex> lock(methodsMutex_);
    return methods_.count(name) > 0;
}

std::vector<RPCMethod> RPCServer::GetMethods() const {
    std::vector<RPCMethod> result;
    {
        std::lock_guard<std::mutex> lock(methodsMutex_);
        for (const auto& [name, method] : methods_) {
            result.push_back(method);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const RPCMethod& a, const RPCMethod& b) {
                         return a.category < b.category;
                     });
    return result;
}

RPCResponse RPCServer::HandleRequest(const RPCRequest& request, const RPCContext& context) {
    ++totalRequests_;

    RPCHandler handler;
    {
        std::lock_guard<std::mutex> lock(methodsMutex_);
        auto it = methods_.find(request.GetMethod());
        if (it != methods_.end()) {
            handler = it->second.handler;
        }
    }

    if (!handler) {
        ++totalErrors_;
        return MethodNotFound(request.GetMethod(), request.GetId());
    }

    try {
        RPCResponse response = handler(request, context);
        if (response.IsError()) {
            ++totalErrors_;
        }
        return response;
    } catch (const std::exception& e) {
        ++totalErrors_;
        LOG_ERROR(util::LogCategory::RPC) << "Method " << request.GetMethod()
            << " failed for " << context.clientAddress << ": " << e.what();
        return InternalError("Internal server error", request.GetId());
    }
}

RPCServer::DispatchResult RPCServer::Dispatch(const std::string& json,
                                              const RPCContext& context) {
    DispatchResult result;

    auto parsed = JSONValue::TryParse(json);
    if (!parsed) {
        result.responses.push_back(ParseError());
        return result;
    }

    if (!parsed->IsArray()) {
        auto request = RPCRequest::FromJSON(*parsed);
        if (!request) {
            result.responses.push_back(InvalidRequest());
        } else if (request->IsNotification()) {
            HandleRequest(*request, context);
        } else {
            result.responses.push_back(HandleRequest(*request, context));
        }
        return result;
    }

    if (parsed->Size() == 0) {
        result.responses.push_back(InvalidRequest());
        return result;
    }

    result.batch = true;
    for (const JSONValue& item : parsed->GetArray()) {
        auto request = RPCRequest::FromJSON(item);
        if (!request) {
            result.responses.push_back(InvalidRequest());
        } else if (request->IsNotification()) {
            HandleRequest(*request, context);
        } else {
            result.responses.push_back(HandleRequest(*request, context));
        }
    }
    return result;
}

std::string RPCServer::HandleRawRequest(const std::string& json, const RPCContext& context) {
    DispatchResult result = Dispatch(json, context);
    if (result.responses.empty()) {
        return "";
    }
    if (!result.batch) {
        return result.responses.front().ToJSON();
    }
    JSONValue array(JSONValue::Array{});
    for (const auto& response : result.responses) {
        array.Push(response.ToValue());
    }
    return array.ToJSON();
}

HTTPReply RPCServer::HandleHTTPRequest(const HTTPRequest& request,
                                       const std::string& peerAddress) {
    const std::string callerId = ResolveCallerId(request, peerAddress, config_.trustProxy);

    std::string pattern = FindSuspiciousPattern(request.target + " " + request.body);
    if (!pattern.empty()) {
        LOG_WARN(util::LogCategory::SECURITY) << "Suspicious request from " << callerId
            << " (pattern '" << pattern << "'): " << request.method << " " << request.target;
    }

    if (request.method != "POST") {
        HTTPReply reply = ErrorReply(405, ErrorCode::INVALID_REQUEST, "Only POST is supported");
        reply.extraHeaders["Allow"] = "POST";
        return reply;
    }

    if (request.contentLength > config_.maxRequestSize ||
        request.body.size() > config_.maxRequestSize) {
        LOG_WARN(util::LogCategory::RPC) << "Rejected oversized request from " << callerId
            << " (" << std::max(request.contentLength, request.body.size()) << " bytes)";
        return ErrorReply(413, ErrorCode::INVALID_REQUEST, "Request too large");
    }

    RPCContext context;
    context.clientAddress = callerId;

    DispatchResult result = Dispatch(request.body, context);

    HTTPReply reply;
    if (result.responses.empty()) {
        reply.status = 204;
        return reply;
    }
    if (!result.batch) {
        const RPCResponse& single = result.responses.front();
        if (single.IsError() && single.GetErrorCode() == ErrorCode::RATE_LIMITED) {
            reply.status = 429;
        }
        reply.body = single.ToJSON();
        return reply;
    }
    JSONValue array(JSONValue::Array{});
    for (const auto& response : result.responses) {
        array.Push(response.ToValue());
    }
    reply.body = array.ToJSON();
    return reply;
}

int64_t RPCServer::GetUptime() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
}

// ============================================================================
// Connection Handling
// ============================================================================

void RPCServer::HTTPServerThread() {
    while (running_.load()) {
        struct sockaddr_in clientAddr;
        socklen_t clientLen = sizeof(clientAddr);

        int clientSocket = accept(serverSocket_,
                                  reinterpret_cast<struct sockaddr*>(&clientAddr),
                                  &clientLen);
        if (clientSocket < 0) {
            if (running_.load() && errno != EINTR) {
                LOG_WARN(util::LogCategory::RPC) << "Accept failed: " << std::strerror(errno);
            }
            continue;
        }

        char addrStr[INET_ADDRSTRLEN] = {0};
        if (!inet_ntop(AF_INET, &clientAddr.sin_addr, addrStr, sizeof(addrStr))) {
            std::strncpy(addrStr, "unknown", sizeof(addrStr) - 1);
        }
        std::string peer(addrStr);

        if (!threadPool_->TrySubmit([this, clientSocket, peer]() {
                HandleConnection(clientSocket, peer);
            })) {
            LOG_WARN(util::LogCategory::RPC) << "Connection queue full, rejecting " << peer;
            SendAll(clientSocket, BuildHTTPResponse(
                ErrorReply(503, ErrorCode::SERVER_BUSY, "Server busy")));
            close(clientSocket);
        }
    }
}

void RPCServer::HandleConnection(int clientSocket, std::string peerAddress) {
    ConnectionGuard guard(clientSocket, activeConnections_);

    struct timeval timeout;
    timeout.tv_sec = config_.requestTimeout > 0 ? config_.requestTimeout : 30;
    timeout.tv_usec = 0;
    if (setsockopt(clientSocket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) != 0) {
        LOG_DEBUG(util::LogCategory::RPC) << "SO_RCVTIMEO failed: " << std::strerror(errno);
    }

    // Read the head
    std::string buffer;
    size_t headEnd = std::string::npos;
    while ((headEnd = buffer.find("\r\n\r\n")) == std::string::npos) {
        if (buffer.size() > MAX_HTTP_HEADER_SIZE) {
            SendAll(clientSocket, BuildHTTPResponse(
                ErrorReply(400, ErrorCode::INVALID_REQUEST, "Request header too large")));
            return;
        }
        if (!ReceiveChunk(clientSocket, buffer)) {
            return;
        }
    }

    auto request = ParseHTTPHead(buffer.substr(0, headEnd));
    if (!request) {
        SendAll(clientSocket, BuildHTTPResponse(
            ErrorReply(400, ErrorCode::INVALID_REQUEST, "Malformed HTTP request")));
        return;
    }

    // Refuse early rather than reading a body we will not accept
    if (request->method != "POST" || request->contentLength > config_.maxRequestSize) {
        SendAll(clientSocket, BuildHTTPResponse(HandleHTTPRequest(*request, peerAddress)));
        return;
    }

    request->body = buffer.substr(headEnd + 4);
    while (request->body.size() < request->contentLength) {
        if (!ReceiveChunk(clientSocket, request->body)) {
            LOG_DEBUG(util::LogCategory::RPC) << "Incomplete request body from " << peerAddress;
            return;
        }
    }
    request->body.resize(request->contentLength);

    HTTPReply reply = HandleHTTPRequest(*request, peerAddress);
    if (!SendAll(clientSocket, BuildHTTPResponse(reply))) {
        LOG_DEBUG(util::LogCategory::RPC) << "Failed to send response to " << peerAddress
            << ": " << std::strerror(errno);
    }
}

} // namespace rpc
} // namespace dirgate
