// DIRGATE - RPC Module Tests
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include <gtest/gtest.h>
#include "dirgate/core/encoding.h"
#include "dirgate/gateway/gateway.h"
#include "dirgate/gateway/options.h"
#include "dirgate/security/path_guard.h"
#include "dirgate/rpc/commands.h"
#include "dirgate/rpc/json.h"
#include "dirgate/rpc/server.h"
#include "dirgate/security/rate_limiter.h"
#include "dirgate/util/fs.h"
#include "dirgate/util/time.h"

#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using namespace dirgate;
using namespace dirgate::rpc;

// ============================================================================
// JSONValue Tests
// ============================================================================

TEST(JSONValueTest, Primitives) {
    JSONValue null;
    EXPECT_TRUE(null.IsNull());
    EXPECT_EQ(null.ToJSON(), "null");

    EXPECT_EQ(JSONValue(true).ToJSON(), "true");
    EXPECT_EQ(JSONValue(42).ToJSON(), "42");
    EXPECT_EQ(JSONValue(int64_t(-7)).ToJSON(), "-7");
    EXPECT_EQ(JSONValue(uint64_t(10)).GetInt(), 10);
    EXPECT_EQ(JSONValue(2.5).ToJSON(), "2.5");
    EXPECT_EQ(JSONValue("text").ToJSON(), "\"text\"");

    EXPECT_TRUE(JSONValue(3).IsNumber());
    EXPECT_DOUBLE_EQ(JSONValue(3).GetDouble(), 3.0);
}

TEST(JSONValueTest, MismatchedGettersReturnDefaults) {
    const JSONValue text("abc");
    EXPECT_EQ(text.GetInt(9), 9);
    EXPECT_FALSE(text.GetBool());
    EXPECT_TRUE(text.GetArray().empty());
    EXPECT_TRUE(JSONValue(1).GetString().empty());
    EXPECT_TRUE(text["missing"].IsNull());
    EXPECT_TRUE(text[size_t(0)].IsNull());
}

TEST(JSONValueTest, BuildObjectsAndArrays) {
    JSONValue obj;
    obj["b"] = 2;
    obj["a"] = "one";
    EXPECT_TRUE(obj.IsObject());
    EXPECT_TRUE(obj.HasKey("a"));
    EXPECT_EQ(obj.Size(), 2u);
    // Keys are written in sorted order
    EXPECT_EQ(obj.ToJSON(), R"({"a":"one","b":2})");

    JSONValue arr;
    arr.Push(1);
    arr.Push(JSONValue());
    arr.Push("x");
    EXPECT_TRUE(arr.IsArray());
    EXPECT_EQ(arr.Size(), 3u);
    EXPECT_EQ(arr[size_t(2)].GetString(), "x");
    EXPECT_EQ(arr.ToJSON(), R"([1,null,"x"])");
}

TEST(JSONValueTest, PrettyPrint) {
    JSONValue obj;
    obj["a"] = 1;
    EXPECT_EQ(obj.ToJSON(true), "{\n  \"a\": 1\n}");
    EXPECT_EQ(JSONValue(JSONValue::Array{}).ToJSON(true), "[]");
}

TEST(JSONValueTest, NonFiniteDoublesBecomeNull) {
    EXPECT_EQ(JSONValue(std::numeric_limits<double>::infinity()).ToJSON(), "null");
    EXPECT_EQ(JSONValue(std::numeric_limits<double>::quiet_NaN()).ToJSON(), "null");
}

TEST(JSONValueTest, Quote) {
    EXPECT_EQ(JSONQuote("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(JSONQuote("line\nbreak\t"), "\"line\\nbreak\\t\"");
    EXPECT_EQ(JSONQuote(std::string("\x01")), "\"\\u0001\"");
}

// ============================================================================
// JSON Parser Tests
// ============================================================================

TEST(JSONParserTest, ParsesDocuments) {
    JSONValue value = JSONValue::Parse(R"( {"b": [1, 2.5, "x", true, false, null], "a": {}} )");
    ASSERT_TRUE(value.IsObject());
    EXPECT_EQ(value["b"].Size(), 6u);
    EXPECT_EQ(std::as_const(value["b"])[size_t(0)].GetInt(), 1);
    EXPECT_DOUBLE_EQ(value["b"][size_t(1)].GetDouble(), 2.5);
    EXPECT_TRUE(value["a"].IsObject());
    EXPECT_EQ(value.ToJSON(), R"({"a":{},"b":[1,2.5,"x",true,false,null]})");
}

TEST(JSONParserTest, StringEscapes) {
    JSONValue value = JSONValue::Parse(R"("q\"b\\s\/n\n\u00e9\ud83d\ude00")");
    EXPECT_EQ(value.GetString(), "q\"b\\s/n\n\xc3\xa9\xf0\x9f\x98\x80");
}

TEST(JSONParserTest, Numbers) {
    EXPECT_TRUE(JSONValue::Parse("-12").IsInt());
    EXPECT_EQ(JSONValue::Parse("-12").GetInt(), -12);
    EXPECT_TRUE(JSONValue::Parse("1e3").IsDouble());

    JSONValue max = JSONValue::Parse("9223372036854775807");
    EXPECT_TRUE(max.IsInt());
    EXPECT_EQ(max.GetInt(), std::numeric_limits<int64_t>::max());

    EXPECT_TRUE(JSONValue::Parse("9223372036854775808").IsDouble());
}

TEST(JSONParserTest, RejectsMalformedInput) {
    const char* bad[] = {
        "", "   ", "{", "[1,]", "{\"a\" 1}", "{\"a\":1,}", "tru", "nul",
        "\"unterminated", "\"raw\ncontrol\"", "\"\\x\"", "\"\\ud800\"",
        "\"\\udc00\"", "1 2", "-", "1.", "1e", "{1:2}",
    };
    for (const char* json : bad) {
        EXPECT_FALSE(JSONValue::TryParse(json).has_value()) << json;
    }
    EXPECT_THROW(JSONValue::Parse("{"), std::runtime_error);
}

TEST(JSONParserTest, DepthLimit) {
    std::string shallow = std::string(10, '[') + std::string(10, ']');
    EXPECT_TRUE(JSONValue::TryParse(shallow).has_value());

    std::string deep = std::string(MAX_JSON_DEPTH + 10, '[') +
                       std::string(MAX_JSON_DEPTH + 10, ']');
    EXPECT_FALSE(JSONValue::TryParse(deep).has_value());
}

// ============================================================================
// RPCRequest / RPCResponse Tests
// ============================================================================

TEST(RPCRequestTest, FromJSON) {
    auto request = RPCRequest::FromJSON(JSONValue::Parse(
        R"({"jsonrpc":"2.0","method":"files.list","params":{"path":"docs"},"id":"abc"})"));
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->GetMethod(), "files.list");
    EXPECT_EQ(request->GetId().GetString(), "abc");
    EXPECT_FALSE(request->IsNotification());
    EXPECT_TRUE(request->HasParam("path"));
    EXPECT_EQ(request->GetParam("path").GetString(), "docs");
    EXPECT_FALSE(request->HasParam("other"));
}

TEST(RPCRequestTest, NotificationHasNoIdMember) {
    auto notification = RPCRequest::FromJSON(
        JSONValue::Parse(R"({"jsonrpc":"2.0","method":"uptime"})"));
    ASSERT_TRUE(notification.has_value());
    EXPECT_TRUE(notification->IsNotification());

    auto nullId = RPCRequest::FromJSON(
        JSONValue::Parse(R"({"jsonrpc":"2.0","method":"uptime","id":null})"));
    ASSERT_TRUE(nullId.has_value());
    EXPECT_FALSE(nullId->IsNotification());
}

TEST(RPCRequestTest, RejectsInvalidEnvelopes) {
    const char* bad[] = {
        R"([])",
        R"({"method":"uptime","id":1})",
        R"({"jsonrpc":"1.0","method":"uptime","id":1})",
        R"({"jsonrpc":"2.0","method":5,"id":1})",
        R"({"jsonrpc":"2.0","method":"uptime","params":"x","id":1})",
        R"({"jsonrpc":"2.0","method":"uptime","id":{}})",
    };
    for (const char* json : bad) {
        EXPECT_FALSE(RPCRequest::FromJSON(JSONValue::Parse(json)).has_value()) << json;
    }
}

TEST(RPCRequestTest, ToJSON) {
    JSONValue params;
    params["path"] = "docs";
    RPCRequest request("files.list", params, JSONValue(7));
    EXPECT_EQ(request.ToJSON(),
              R"({"id":7,"jsonrpc":"2.0","method":"files.list","params":{"path":"docs"}})");
}

TEST(RPCResponseTest, Serialization) {
    EXPECT_EQ(RPCResponse::Success(JSONValue(5), JSONValue(1)).ToJSON(),
              R"({"id":1,"jsonrpc":"2.0","result":5})");

    JSONValue data;
    data["kind"] = "InvalidInput";
    RPCResponse error = RPCResponse::Error(ErrorCode::INVALID_PARAMS, "bad", JSONValue("x"), data);
    EXPECT_TRUE(error.IsError());
    EXPECT_EQ(error.ToJSON(),
              R"({"error":{"code":-32602,"data":{"kind":"InvalidInput"},"message":"bad"},"id":"x","jsonrpc":"2.0"})");
}

// ============================================================================
// RPCServer Dispatch Tests
// ============================================================================

class RPCServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        RPCMethod echo;
        echo.name = "echo";
        echo.category = "test";
        echo.handler = [](const RPCRequest& req, const RPCContext& ctx) {
            JSONValue result;
            result["params"] = req.GetParams();
            result["caller"] = ctx.clientAddress;
            return RPCResponse::Success(result, req.GetId());
        };
        server_.RegisterMethod(echo);

        RPCMethod fail;
        fail.name = "fail";
        fail.category = "test";
        fail.handler = [](const RPCRequest&, const RPCContext&) -> RPCResponse {
            throw std::runtime_error("disk on fire");
        };
        server_.RegisterMethod(fail);
    }

    JSONValue Raw(const std::string& json) {
        std::string reply = server_.HandleRawRequest(json, context_);
        return reply.empty() ? JSONValue() : JSONValue::Parse(reply);
    }

    static HTTPRequest Post(const std::string& body) {
        HTTPRequest request;
        request.method = "POST";
        request.target = "/";
        request.version = "HTTP/1.1";
        request.body = body;
        request.contentLength = body.size();
        return request;
    }

    RPCServer server_;
    RPCContext context_{"198.51.100.1"};
};

TEST_F(RPCServerTest, SingleRequest) {
    JSONValue reply = Raw(R"({"jsonrpc":"2.0","method":"echo","params":[1],"id":3})");
    EXPECT_EQ(reply["id"].GetInt(), 3);
    EXPECT_EQ(reply["result"]["caller"].GetString(), "198.51.100.1");
    EXPECT_EQ(reply["result"]["params"].ToJSON(), "[1]");
}

TEST_F(RPCServerTest, ProtocolErrors) {
    JSONValue parse = Raw("{not json");
    EXPECT_EQ(parse["error"]["code"].GetInt(), ErrorCode::PARSE_ERROR);
    EXPECT_TRUE(parse["id"].IsNull());

    JSONValue invalid = Raw(R"({"method":"echo","id":1})");
    EXPECT_EQ(invalid["error"]["code"].GetInt(), ErrorCode::INVALID_REQUEST);

    JSONValue missing = Raw(R"({"jsonrpc":"2.0","method":"nope","id":1})");
    EXPECT_EQ(missing["error"]["code"].GetInt(), ErrorCode::METHOD_NOT_FOUND);
    EXPECT_EQ(missing["error"]["message"].GetString(), "Method not found: nope");

    JSONValue empty = Raw("[]");
    EXPECT_TRUE(empty.IsObject());
    EXPECT_EQ(empty["error"]["code"].GetInt(), ErrorCode::INVALID_REQUEST);
}

TEST_F(RPCServerTest, HandlerExceptionsAreHidden) {
    uint64_t errorsBefore = server_.TotalErrors();
    JSONValue reply = Raw(R"({"jsonrpc":"2.0","method":"fail","id":1})");
    EXPECT_EQ(reply["error"]["code"].GetInt(), ErrorCode::INTERNAL_ERROR);
    EXPECT_EQ(reply["error"]["message"].GetString(), "Internal server error");
    EXPECT_EQ(server_.TotalErrors(), errorsBefore + 1);
}

TEST_F(RPCServerTest, NotificationsGetNoResponse) {
    uint64_t before = server_.TotalRequests();
    EXPECT_EQ(server_.HandleRawRequest(R"({"jsonrpc":"2.0","method":"echo"})", context_), "");
    EXPECT_EQ(server_.TotalRequests(), before + 1);
}

TEST_F(RPCServerTest, Batches) {
    JSONValue reply = Raw(R"([
        {"jsonrpc":"2.0","method":"echo","id":1},
        {"jsonrpc":"2.0","method":"echo"},
        5
    ])");
    ASSERT_TRUE(reply.IsArray());
    ASSERT_EQ(reply.Size(), 2u);
    EXPECT_EQ(std::as_const(reply)[size_t(0)]["id"].GetInt(), 1);
    EXPECT_EQ(reply[size_t(1)]["error"]["code"].GetInt(), ErrorCode::INVALID_REQUEST);

    EXPECT_EQ(server_.HandleRawRequest(
        R"([{"jsonrpc":"2.0","method":"echo"},{"jsonrpc":"2.0","method":"echo"}])", context_), "");
}

TEST_F(RPCServerTest, MethodRegistry) {
    RPCMethod other;
    other.name = "alpha";
    other.category = "a-first";
    other.handler = [](const RPCRequest& req, const RPCContext&) {
        return RPCResponse::Success(JSONValue(), req.GetId());
    };
    server_.RegisterMethod(other);

    auto methods = server_.GetMethods();
    ASSERT_EQ(methods.size(), 3u);
    EXPECT_EQ(methods[0].name, "alpha");

    EXPECT_TRUE(server_.HasMethod("echo"));
    server_.UnregisterMethod("echo");
    EXPECT_FALSE(server_.HasMethod("echo"));
}

// ============================================================================
// HTTP Handling Tests
// ============================================================================

TEST(HTTPParseTest, ParsesHead) {
    auto request = RPCServer::ParseHTTPHead(
        "POST /rpc HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 12\r\n"
        "X-Forwarded-For:  203.0.113.5 \r\n");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method, "POST");
    EXPECT_EQ(request->target, "/rpc");
    EXPECT_EQ(request->version, "HTTP/1.1");
    EXPECT_EQ(request->contentLength, 12u);
    EXPECT_EQ(request->Header("host"), "localhost");
    EXPECT_EQ(request->Header("x-forwarded-for"), "203.0.113.5");
    EXPECT_EQ(request->Header("missing"), "");
}

TEST(HTTPParseTest, RejectsMalformedHead) {
    EXPECT_FALSE(RPCServer::ParseHTTPHead("").has_value());
    EXPECT_FALSE(RPCServer::ParseHTTPHead("GARBAGE").has_value());
    EXPECT_FALSE(RPCServer::ParseHTTPHead("POST / FTP/1.0").has_value());
    EXPECT_FALSE(RPCServer::ParseHTTPHead("POST / HTTP/1.1\r\nNoColon").has_value());
    EXPECT_FALSE(RPCServer::ParseHTTPHead("POST / HTTP/1.1\r\nContent-Length: 12a").has_value());
    EXPECT_FALSE(RPCServer::ParseHTTPHead("POST / HTTP/1.1\r\nContent-Length: -1").has_value());
}

TEST(HTTPResponseTest, CarriesSecurityHeaders) {
    HTTPReply reply;
    reply.body = "{}";
    std::string response = RPCServer::BuildHTTPResponse(reply);

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(response.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(response.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_NE(response.find("X-Frame-Options: DENY\r\n"), std::string::npos);
    EXPECT_NE(response.find("X-Content-Type-Options: nosniff\r\n"), std::string::npos);
    EXPECT_NE(response.find("X-XSS-Protection: 1; mode=block\r\n"), std::string::npos);
    EXPECT_NE(response.find("Referrer-Policy: strict-origin-when-cross-origin\r\n"),
              std::string::npos);
    EXPECT_NE(response.find("Content-Security-Policy: default-src 'none'"), std::string::npos);
    EXPECT_NE(response.find("Cache-Control: no-store\r\n"), std::string::npos);
    EXPECT_EQ(response.substr(response.size() - 6), "\r\n\r\n{}");
}

TEST(HTTPResponseTest, NoContentHasNoBody) {
    HTTPReply reply;
    reply.status = 204;
    reply.body = "ignored";
    std::string response = RPCServer::BuildHTTPResponse(reply);

    EXPECT_EQ(response.rfind("HTTP/1.1 204 No Content\r\n", 0), 0u);
    EXPECT_EQ(response.find("Content-Type"), std::string::npos);
    EXPECT_EQ(response.substr(response.size() - 4), "\r\n\r\n");
}

TEST(HTTPCallerTest, ResolveCallerId) {
    HTTPRequest request;
    request.headers["x-forwarded-for"] = "203.0.113.5, 10.0.0.1";
    request.headers["x-real-ip"] = "203.0.113.9";

    EXPECT_EQ(RPCServer::ResolveCallerId(request, "10.0.0.2", false), "10.0.0.2");
    EXPECT_EQ(RPCServer::ResolveCallerId(request, "10.0.0.2", true), "203.0.113.5");

    request.headers.erase("x-forwarded-for");
    EXPECT_EQ(RPCServer::ResolveCallerId(request, "10.0.0.2", true), "203.0.113.9");

    request.headers.clear();
    EXPECT_EQ(RPCServer::ResolveCallerId(request, "10.0.0.2", true), "10.0.0.2");
}

TEST(HTTPCallerTest, SuspiciousPatterns) {
    EXPECT_EQ(RPCServer::FindSuspiciousPattern("/files/../etc"), "../");
    EXPECT_EQ(RPCServer::FindSuspiciousPattern("/%2E%2E/secret"), "%2e%2e");
    EXPECT_EQ(RPCServer::FindSuspiciousPattern("name=<SCRIPT>"), "<script");
    EXPECT_EQ(RPCServer::FindSuspiciousPattern("{\"path\":\"docs/report.txt\"}"), "");
}

TEST_F(RPCServerTest, HTTPMethodAndSizeLimits) {
    HTTPRequest get = Post("");
    get.method = "GET";
    HTTPReply reply = server_.HandleHTTPRequest(get, "10.0.0.2");
    EXPECT_EQ(reply.status, 405);
    EXPECT_EQ(reply.extraHeaders["Allow"], "POST");

    RPCServerConfig config;
    config.maxRequestSize = 100;
    RPCServer small(config);
    HTTPRequest big = Post(std::string(50, ' '));
    big.contentLength = 1000;
    EXPECT_EQ(small.HandleHTTPRequest(big, "10.0.0.2").status, 413);
}

TEST_F(RPCServerTest, HTTPStatusFollowsDispatch) {
    HTTPReply ok = server_.HandleHTTPRequest(
        Post(R"({"jsonrpc":"2.0","method":"echo","id":1})"), "10.0.0.2");
    EXPECT_EQ(ok.status, 200);
    EXPECT_EQ(JSONValue::Parse(ok.body)["result"]["caller"].GetString(), "10.0.0.2");

    HTTPReply none = server_.HandleHTTPRequest(
        Post(R"({"jsonrpc":"2.0","method":"echo"})"), "10.0.0.2");
    EXPECT_EQ(none.status, 204);
    EXPECT_TRUE(none.body.empty());

    HTTPReply parseError = server_.HandleHTTPRequest(Post("oops"), "10.0.0.2");
    EXPECT_EQ(parseError.status, 200);
    EXPECT_EQ(JSONValue::Parse(parseError.body)["error"]["code"].GetInt(),
              ErrorCode::PARSE_ERROR);
}

TEST(RPCLimitsTest, MaxRequestSizeCoversBase64Upload) {
    EXPECT_EQ(MaxRequestSizeFor(3), 4u + 64 * 1024);
    EXPECT_EQ(MaxRequestSizeFor(4), 8u + 64 * 1024);
    EXPECT_GT(MaxRequestSizeFor(10 * 1024 * 1024), 10u * 1024 * 1024 * 4 / 3);
}

// ============================================================================
// Command Tests
// ============================================================================

class RPCCommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(tmp_.IsValid());
        root_ = tmp_.GetPath();
        options_.root = root_.String();
        Rebuild();
    }

    void Rebuild() {
        server_.reset();
        table_.reset();
        gateway_.reset();
        limiter_.reset(new security::RateLimiter(options_.RateLimiterConfig()));
        gateway_.reset(new gateway::Gateway(options_, *limiter_));
        table_.reset(new RPCCommandTable(*gateway_));
        server_.reset(new RPCServer());
        table_->RegisterCommands(*server_);
    }

    HTTPReply CallHTTP(const std::string& method, const JSONValue& params) {
        RPCRequest request(method, params, JSONValue(1));
        HTTPRequest http;
        http.method = "POST";
        http.target = "/";
        http.version = "HTTP/1.1";
        http.body = request.ToJSON();
        http.contentLength = http.body.size();
        return server_->HandleHTTPRequest(http, "192.0.2.44");
    }

    JSONValue Call(const std::string& method, const JSONValue& params = JSONValue()) {
        return JSONValue::Parse(CallHTTP(method, params).body);
    }

    static std::vector<uint8_t> Bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::string Abs(const std::string& relative) const {
        return (root_ / relative).String();
    }

    util::fs::TempDirectory tmp_{"dirgate_rpc_test"};
    util::fs::Path root_;
    gateway::GatewayOptions options_;
    std::unique_ptr<security::RateLimiter> limiter_;
    std::unique_ptr<gateway::Gateway> gateway_;
    std::unique_ptr<RPCCommandTable> table_;
    std::unique_ptr<RPCServer> server_;
};

TEST_F(RPCCommandsTest, RegistersAllCommands) {
    for (const char* name : {"files.list", "files.defaultpath", "files.search",
                             "files.download", "files.upload", "files.copy",
                             "files.move", "help", "uptime"}) {
        EXPECT_TRUE(server_->HasMethod(name)) << name;
    }
    EXPECT_EQ(table_->GetAllCommands().size(), 9u);
}

TEST_F(RPCCommandsTest, DefaultPath) {
    JSONValue reply = Call("files.defaultpath");
    EXPECT_EQ(reply["result"]["path"].GetString(), root_.String());
}

TEST_F(RPCCommandsTest, ListWithNamedAndPositionalParams) {
    ASSERT_TRUE(util::fs::CreateDirectories(root_ / "sub"));
    ASSERT_TRUE(util::fs::WriteFile(root_ / "sub/a.txt", "abc"));

    JSONValue rootList = Call("files.list");
    ASSERT_TRUE(rootList.HasKey("result")) << rootList.ToJSON();
    EXPECT_EQ(rootList["result"]["directory"].GetString(), root_.String());
    ASSERT_EQ(rootList["result"]["entries"].Size(), 1u);
    EXPECT_TRUE(std::as_const(rootList["result"]["entries"])[size_t(0)]["isDirectory"].GetBool());

    JSONValue named;
    named["path"] = "sub";
    JSONValue subList = Call("files.list", named);
    const JSONValue& entry = std::as_const(subList["result"]["entries"])[size_t(0)];
    EXPECT_EQ(entry["name"].GetString(), "a.txt");
    EXPECT_EQ(entry["path"].GetString(), Abs("sub/a.txt"));
    EXPECT_EQ(entry["size"].GetInt(), 3);
    EXPECT_EQ(entry["modified"].GetString().size(), 20u);

    JSONValue positional;
    positional.Push("sub");
    EXPECT_EQ(Call("files.list", positional)["result"]["entries"].Size(), 1u);
}

TEST_F(RPCCommandsTest, ParamTypeErrors) {
    JSONValue params;
    params["path"] = 5;
    JSONValue reply = Call("files.list", params);
    EXPECT_EQ(reply["error"]["code"].GetInt(), ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(reply["error"]["message"].GetString(), "Parameter 'path' must be a string");

    JSONValue search;
    search["path"] = root_.String();
    search["term"] = "x";
    search["maxResults"] = -1;
    EXPECT_EQ(Call("files.search", search)["error"]["code"].GetInt(),
              ErrorCode::INVALID_PARAMS);

    search["maxResults"] = 5;
    search["includeSubdirectories"] = "yes";
    EXPECT_EQ(Call("files.search", search)["error"]["message"].GetString(),
              "Parameter 'includeSubdirectories' must be a boolean");
}

TEST_F(RPCCommandsTest, UploadDownloadAndSearch) {
    std::vector<uint8_t> content = Bytes("hello dirgate");

    JSONValue upload;
    upload["path"] = root_.String();
    upload["fileName"] = "hello.txt";
    upload["contentType"] = "text/plain";
    upload["data"] = Base64Encode(content);

    JSONValue uploaded = Call("files.upload", upload);
    ASSERT_TRUE(uploaded.HasKey("result")) << uploaded.ToJSON();
    EXPECT_EQ(uploaded["result"]["fileName"].GetString(), "hello.txt");
    EXPECT_EQ(uploaded["result"]["size"].GetInt(), 13);
    EXPECT_EQ(uploaded["result"]["path"].GetString(), Abs("hello.txt"));

    JSONValue download;
    download["path"] = "hello.txt";
    JSONValue downloaded = Call("files.download", download);
    ASSERT_TRUE(downloaded.HasKey("result")) << downloaded.ToJSON();
    EXPECT_EQ(downloaded["result"]["fileName"].GetString(), "hello.txt");
    EXPECT_EQ(downloaded["result"]["contentType"].GetString(), "application/octet-stream");
    EXPECT_EQ(downloaded["result"]["size"].GetInt(), 13);
    EXPECT_EQ(downloaded["result"]["data"].GetString(), Base64Encode(content));
    EXPECT_EQ(downloaded["result"]["sha256"].GetString(), Sha256Hex(content));

    JSONValue search;
    search["path"] = root_.String();
    search["term"] = "HELLO";
    JSONValue found = Call("files.search", search);
    ASSERT_TRUE(found.HasKey("result")) << found.ToJSON();
    EXPECT_EQ(found["result"]["count"].GetInt(), 1);
    EXPECT_EQ(std::as_const(found["result"]["entries"])[size_t(0)]["name"].GetString(), "hello.txt");
    EXPECT_FALSE(found["result"]["truncated"].GetBool(true));
    EXPECT_FALSE(found["result"]["timedOut"].GetBool(true));
    EXPECT_EQ(found["result"]["message"].GetString(), "Found 1 results (limit: 10000)");
}

TEST_F(RPCCommandsTest, UploadRejections) {
    JSONValue upload;
    upload["path"] = root_.String();
    upload["fileName"] = "a.txt";
    upload["contentType"] = "text/plain";
    upload["data"] = "not base64!";

    JSONValue reply = Call("files.upload", upload);
    EXPECT_EQ(reply["error"]["code"].GetInt(), ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(reply["error"]["message"].GetString(), "Parameter 'data' is not valid base64");

    upload["fileName"] = "evil.php";
    upload["data"] = Base64Encode(Bytes("<?php system($_GET['c']); ?>"));
    reply = Call("files.upload", upload);
    EXPECT_EQ(reply["error"]["code"].GetInt(), ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(reply["error"]["data"]["kind"].GetString(), "InvalidInput");
    EXPECT_FALSE(util::fs::Exists(root_ / "evil.php"));
}

TEST_F(RPCCommandsTest, GatewayFailuresMapToErrorCodes) {
    JSONValue outside;
    outside["path"] = "/etc/passwd";
    JSONValue denied = Call("files.download", outside);
    EXPECT_EQ(denied["error"]["code"].GetInt(), ErrorCode::ACCESS_DENIED);
    EXPECT_EQ(denied["error"]["message"].GetString(), security::OUTSIDE_ROOT_REASON);
    EXPECT_EQ(denied["error"]["data"]["kind"].GetString(), "AccessDenied");

    JSONValue missing;
    missing["path"] = "missing.txt";
    EXPECT_EQ(Call("files.download", missing)["error"]["code"].GetInt(), ErrorCode::NOT_FOUND);
}

TEST_F(RPCCommandsTest, CopyThenMove) {
    ASSERT_TRUE(util::fs::WriteFile(root_ / "a.txt", "alpha"));

    JSONValue copy;
    copy["sourcePath"] = Abs("a.txt");
    copy["destinationPath"] = Abs("sub/a.txt");
    JSONValue copied = Call("files.copy", copy);
    ASSERT_TRUE(copied.HasKey("result")) << copied.ToJSON();
    EXPECT_EQ(copied["result"]["destination"].GetString(), Abs("sub/a.txt"));

    JSONValue list;
    list["path"] = Abs("sub");
    JSONValue listed = Call("files.list", list);
    ASSERT_EQ(listed["result"]["entries"].Size(), 1u);
    EXPECT_EQ(std::as_const(listed["result"]["entries"])[size_t(0)]["name"].GetString(), "a.txt");

    JSONValue move;
    move.Push("a.txt");
    move.Push("archive/b.txt");
    JSONValue moved = Call("files.move", move);
    ASSERT_TRUE(moved.HasKey("result")) << moved.ToJSON();
    EXPECT_EQ(moved["result"]["destination"].GetString(), Abs("archive/b.txt"));
    EXPECT_FALSE(util::fs::Exists(root_ / "a.txt"));
}

TEST_F(RPCCommandsTest, RateLimitedCallsGet429) {
    options_.rateMaxRequests = 1;
    Rebuild();

    EXPECT_EQ(CallHTTP("files.list", JSONValue()).status, 200);

    HTTPReply limited = CallHTTP("files.list", JSONValue());
    EXPECT_EQ(limited.status, 429);
    JSONValue body = JSONValue::Parse(limited.body);
    EXPECT_EQ(body["error"]["code"].GetInt(), ErrorCode::RATE_LIMITED);
    EXPECT_EQ(body["error"]["message"].GetString(), gateway::RATE_LIMITED_MESSAGE);
    EXPECT_EQ(body["error"]["data"]["kind"].GetString(), "RateLimited");

    // Default path is not rate limited
    EXPECT_EQ(CallHTTP("files.defaultpath", JSONValue()).status, 200);
}

TEST_F(RPCCommandsTest, Help) {
    JSONValue all = Call("help");
    ASSERT_TRUE(all.HasKey("result"));
    EXPECT_EQ(all["result"]["files"].Size(), 7u);
    EXPECT_EQ(all["result"]["utility"].Size(), 2u);

    JSONValue one;
    one["command"] = "files.copy";
    JSONValue detail = Call("help", one);
    EXPECT_EQ(detail["result"]["category"].GetString(), "files");
    ASSERT_EQ(detail["result"]["arguments"].Size(), 2u);
    EXPECT_EQ(std::as_const(detail["result"]["arguments"])[size_t(0)]["name"].GetString(), "sourcePath");

    JSONValue unknown;
    unknown["command"] = "nope";
    JSONValue error = Call("help", unknown);
    EXPECT_EQ(error["error"]["code"].GetInt(), ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(error["error"]["message"].GetString(), "Unknown command: nope");
}

TEST_F(RPCCommandsTest, Uptime) {
    JSONValue reply = Call("uptime");
    EXPECT_TRUE(reply["result"].IsInt());
    EXPECT_GE(reply["result"].GetInt(), 0);
}

TEST(RPCHelpersTest, ErrorKindToCode) {
    EXPECT_EQ(ErrorKindToCode(ErrorKind::InvalidInput), ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(ErrorKindToCode(ErrorKind::NotFound), ErrorCode::NOT_FOUND);
    EXPECT_EQ(ErrorKindToCode(ErrorKind::AccessDenied), ErrorCode::ACCESS_DENIED);
    EXPECT_EQ(ErrorKindToCode(ErrorKind::RateLimited), ErrorCode::RATE_LIMITED);
    EXPECT_EQ(ErrorKindToCode(ErrorKind::Internal), ErrorCode::INTERNAL_ERROR);
}

TEST(RPCHelpersTest, FileEntryToJSON) {
    FileEntry entry;
    entry.name = "docs";
    entry.absolutePath = "/srv/docs";
    entry.isDirectory = true;
    entry.lastModified = util::FromUnixTime(1705314600);

    EXPECT_EQ(FileEntryToJSON(entry).ToJSON(),
              R"({"isDirectory":true,"modified":"2024-01-15T10:30:00Z","name":"docs","path":"/srv/docs","size":0})");
}

// ============================================================================
// Loopback Server Test
// ============================================================================

TEST(RPCLoopbackTest, ServesOverHTTP) {
    RPCServerConfig config;
    config.port = 0;
    config.threadPoolSize = 1;
    RPCServer server(config);

    RPCMethod ping;
    ping.name = "ping";
    ping.category = "test";
    ping.handler = [](const RPCRequest& req, const RPCContext&) {
        return RPCResponse::Success(JSONValue("pong"), req.GetId());
    };
    server.RegisterMethod(ping);

    ASSERT_TRUE(server.Start());
    ASSERT_NE(server.BoundPort(), 0);

    int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(sock, 0);
    struct timeval timeout{5, 0};
    ::setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(server.BoundPort());
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);

    std::string body = R"({"jsonrpc":"2.0","method":"ping","id":1})";
    std::string request = "POST / HTTP/1.1\r\nHost: 127.0.0.1\r\nContent-Length: " +
                          std::to_string(body.size()) + "\r\n\r\n" + body;
    ASSERT_EQ(::send(sock, request.data(), request.size(), 0),
              static_cast<ssize_t>(request.size()));

    std::string response;
    char buf[1024];
    ssize_t n;
    while ((n = ::recv(sock, buf, sizeof(buf), 0)) > 0) {
        response.append(buf, static_cast<size_t>(n));
    }
    ::close(sock);
    server.Stop();

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
    EXPECT_NE(response.find("X-Frame-Options: DENY"), std::string::npos);
    EXPECT_NE(response.find(R"("result":"pong")"), std::string::npos);
    EXPECT_FALSE(server.IsRunning());
}
