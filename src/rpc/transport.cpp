// ETHWALLET - JSON-RPC Transport Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/rpc/transport.h"
#include "ethwallet/core/errors.h"
#include "ethwallet/core/hex.h"
#include "ethwallet/core/units.h"
#include "ethwallet/util/logging.h"
#include "ethwallet/util/time.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace ethwallet {
namespace rpc {

namespace LogCategory = util::LogCategory;

namespace {

/// Closes the socket on scope exit
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) close(fd_);
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int Get() const { return fd_; }

private:
    int fd_;
};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

[[noreturn]] void TransportError(const std::string& message) {
    throw WalletError(ErrorCode::TransportFailure, message);
}

/// Whether a buffered response is complete (Content-Length or final chunk)
bool ResponseComplete(const std::string& response) {
    size_t headerEnd = response.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return false;
    }

    std::string lowerHeaders = ToLower(response.substr(0, headerEnd));
    size_t bodyStart = headerEnd + 4;

    if (lowerHeaders.find("transfer-encoding: chunked") != std::string::npos) {
        std::string body = response.substr(bodyStart);
        return body.compare(0, 5, "0\r\n\r\n") == 0 ||
               body.find("\r\n0\r\n\r\n") != std::string::npos;
    }

    size_t clPos = lowerHeaders.find("content-length:");
    if (clPos == std::string::npos) {
        // Read until the server closes
        return false;
    }
    size_t clEnd = lowerHeaders.find("\r\n", clPos);
    std::string clStr = lowerHeaders.substr(clPos + 15, clEnd == std::string::npos
                                                            ? std::string::npos
                                                            : clEnd - clPos - 15);
    char* end = nullptr;
    unsigned long long contentLength = std::strtoull(clStr.c_str(), &end, 10);
    return response.size() >= bodyStart + contentLength;
}

/// Hex quantity result as decimal
std::string QuantityResult(const JSONValue& result, const char* method) {
    if (!result.IsString() || !IsValidQuantity(result.GetString())) {
        TransportError(std::string("Unexpected result for ") + method);
    }
    return NormalizeQuantity(result.GetString());
}

} // anonymous namespace

// ============================================================================
// HttpTransportConfig
// ============================================================================

HttpTransportConfig HttpTransportConfig::FromUrl(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("Only http:// URLs are supported: " + url);
    }

    HttpTransportConfig config;
    std::string rest = url.substr(scheme.size());

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    config.path = slash == std::string::npos ? "/" : rest.substr(slash);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        std::string portStr = authority.substr(colon + 1);
        if (portStr.empty() || portStr.size() > 5 ||
            !std::all_of(portStr.begin(), portStr.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("Invalid port in URL: " + url);
        }
        unsigned long port = std::stoul(portStr);
        if (port == 0 || port > 65535) {
            throw std::invalid_argument("Invalid port in URL: " + url);
        }
        config.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    } else {
        config.port = 80;
    }

    if (authority.size() >= 2 && authority.front() == '[' && authority.back() == ']') {
        authority = authority.substr(1, authority.size() - 2);
    }
    if (authority.empty()) {
        throw std::invalid_argument("Missing host in URL: " + url);
    }
    config.host = authority;
    return config;
}

// ============================================================================
// HttpRpcTransport Implementation
// ============================================================================

HttpRpcTransport::HttpRpcTransport(const HttpTransportConfig& config) : config_(config) {}

HttpRpcTransport::HttpRpcTransport(const std::string& url)
    : config_(HttpTransportConfig::FromUrl(url)) {}

JSONValue HttpRpcTransport::Call(const std::string& method, const JSONValue& params) {
    ++totalCalls_;

    JSONValue request = JSONValue::MakeObject();
    request["jsonrpc"] = "2.0";
    request["method"] = method;
    request["params"] = params.IsNull() ? JSONValue::MakeArray() : params;
    request["id"] = nextId_.fetch_add(1);

    LOG_TRACE(LogCategory::RPC) << "-> " << method;

    try {
        std::string response = SendRequest(BuildHTTPRequest(request.ToJSON()));

        std::string body;
        int statusCode = 0;
        if (!ParseHTTPResponse(response, body, statusCode)) {
            TransportError("Invalid HTTP response");
        }
        // Nodes report JSON-RPC errors with non-200 codes too; prefer the body
        if (statusCode != 200 && !JSONValue::TryParse(body)) {
            TransportError("HTTP status " + std::to_string(statusCode));
        }
        return ExtractResult(body);
    } catch (const WalletError& e) {
        ++totalErrors_;
        LOG_WARN(LogCategory::RPC) << method << " failed: " << e.what();
        throw;
    }
}

std::string HttpRpcTransport::SendRequest(const std::string& request) {
    struct addrinfo hints;
    struct addrinfo* result = nullptr;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string portStr = std::to_string(config_.port);
    if (getaddrinfo(config_.host.c_str(), portStr.c_str(), &hints, &result) != 0) {
        TransportError("Failed to resolve host: " + config_.host);
    }

    int fd = -1;
    for (struct addrinfo* p = result; p != nullptr; p = p->ai_next) {
        fd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0) continue;

        struct timeval tv;
        tv.tv_sec = config_.connectTimeout;
        tv.tv_usec = 0;
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (connect(fd, p->ai_addr, p->ai_addrlen) == 0) {
            break;
        }
        close(fd);
        fd = -1;
    }
    freeaddrinfo(result);

    if (fd < 0) {
        TransportError("Failed to connect to " + config_.host + ":" + portStr);
    }
    SocketGuard guard(fd);

    struct timeval tv;
    tv.tv_sec = config_.requestTimeout;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    size_t totalSent = 0;
    while (totalSent < request.size()) {
        ssize_t sent = send(fd, request.data() + totalSent, request.size() - totalSent, MSG_NOSIGNAL);
        if (sent <= 0) {
            TransportError("Send failed");
        }
        totalSent += static_cast<size_t>(sent);
    }

    std::string response;
    char buffer[4096];
    while (!ResponseComplete(response)) {
        ssize_t received = recv(fd, buffer, sizeof(buffer), 0);
        if (received < 0) {
            TransportError("Receive failed");
        }
        if (received == 0) break;
        response.append(buffer, static_cast<size_t>(received));
    }

    return response;
}

std::string HttpRpcTransport::BuildHTTPRequest(const std::string& body) const {
    std::ostringstream ss;
    ss << "POST " << config_.path << " HTTP/1.1\r\n";
    ss << "Host: " << config_.host << ":" << config_.port << "\r\n";
    ss << "Content-Type: application/json\r\n";
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << body;
    return ss.str();
}

bool HttpRpcTransport::ParseHTTPResponse(const std::string& raw, std::string& body, int& statusCode) {
    size_t statusEnd = raw.find("\r\n");
    if (statusEnd == std::string::npos) return false;

    // "HTTP/1.1 200 OK"
    std::string statusLine = raw.substr(0, statusEnd);
    if (statusLine.compare(0, 5, "HTTP/") != 0) return false;
    size_t codeStart = statusLine.find(' ');
    if (codeStart == std::string::npos || codeStart + 4 > statusLine.size()) return false;
    std::string code = statusLine.substr(codeStart + 1, 3);
    if (!std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    statusCode = std::stoi(code);

    size_t headersEnd = raw.find("\r\n\r\n");
    if (headersEnd == std::string::npos) return false;
    size_t bodyStart = headersEnd + 4;

    std::string lowerHeaders = ToLower(raw.substr(0, headersEnd));

    if (lowerHeaders.find("transfer-encoding: chunked") == std::string::npos) {
        body = raw.substr(bodyStart);
        return true;
    }

    // Decode chunked body
    body.clear();
    std::string rawBody = raw.substr(bodyStart);
    size_t pos = 0;

    while (pos < rawBody.size()) {
        size_t lineEnd = rawBody.find("\r\n", pos);
        if (lineEnd == std::string::npos) return false;

        std::string sizeStr = rawBody.substr(pos, lineEnd - pos);
        size_t extPos = sizeStr.find(';');
        if (extPos != std::string::npos) {
            sizeStr = sizeStr.substr(0, extPos);
        }
        if (sizeStr.empty() || !std::all_of(sizeStr.begin(), sizeStr.end(),
                                            [](unsigned char c) { return std::isxdigit(c); })) {
            return false;
        }
        // Wider than size_t cannot describe a chunk we could hold
        if (sizeStr.size() > 2 * sizeof(size_t)) return false;
        size_t chunkSize = static_cast<size_t>(std::strtoull(sizeStr.c_str(), nullptr, 16));
        if (chunkSize == 0) {
            return true;
        }

        pos = lineEnd + 2;
        if (chunkSize > rawBody.size() - pos) return false;
        body += rawBody.substr(pos, chunkSize);
        pos += chunkSize;

        if (rawBody.compare(pos, 2, "\r\n") == 0) {
            pos += 2;
        }
    }

    // Missing terminating chunk
    return false;
}

JSONValue HttpRpcTransport::ExtractResult(const std::string& body) {
    auto parsed = JSONValue::TryParse(body);
    if (!parsed || !parsed->IsObject()) {
        TransportError("Invalid JSON-RPC response");
    }

    const JSONValue& error = (*parsed)["error"];
    if (!error.IsNull()) {
        std::string message = error["message"].GetString("Unknown error");
        TransportError("JSON-RPC error " + std::to_string(error["code"].GetInt()) + ": " + message);
    }

    if (!parsed->HasKey("result")) {
        TransportError("JSON-RPC response without result");
    }
    return (*parsed)["result"];
}

// ============================================================================
// ReceiptPoller Implementation
// ============================================================================

ReceiptPoller::ReceiptPoller(IRpcTransport& transport, const Config& config)
    : transport_(transport), config_(config) {}

wallet::TransactionResult ReceiptPoller::WaitForReceipt(const std::string& txHash) const {
    LOG_DEBUG(LogCategory::RPC) << "Waiting for receipt of " << txHash;

    for (uint32_t attempt = 0; attempt < config_.maxAttempts; ++attempt) {
        if (attempt > 0) {
            util::SleepMillis(config_.intervalMs);
        }
        JSONValue receipt = transport_.Call("eth_getTransactionReceipt", Params({txHash}));
        if (!receipt.IsNull()) {
            wallet::TransactionResult result = wallet::TransactionResult::FromReceipt(receipt);
            LOG_INFO(LogCategory::RPC) << "Receipt for " << txHash << " status " << result.id;
            return result;
        }
    }

    TransportError("No receipt for " + txHash + " after " +
                   std::to_string(config_.maxAttempts) + " attempts");
}

// ============================================================================
// Ethereum Method Helpers
// ============================================================================

JSONValue Params(std::initializer_list<std::string> values) {
    JSONValue params = JSONValue::MakeArray();
    for (const auto& v : values) {
        params.Push(JSONValue(v));
    }
    return params;
}

ChainId GetChainId(IRpcTransport& transport) {
    std::string chainId = QuantityResult(transport.Call("eth_chainId", JSONValue::MakeArray()),
                                         "eth_chainId");
    return QuantityToUint64(chainId);
}

std::string GetBalance(IRpcTransport& transport, const std::string& address) {
    return QuantityResult(transport.Call("eth_getBalance", Params({address, "latest"})),
                          "eth_getBalance");
}

uint64_t GetTransactionCount(IRpcTransport& transport, const std::string& address) {
    std::string count = QuantityResult(
        transport.Call("eth_getTransactionCount", Params({address, "pending"})),
        "eth_getTransactionCount");
    return QuantityToUint64(count);
}

std::string GetGasPrice(IRpcTransport& transport) {
    return QuantityResult(transport.Call("eth_gasPrice", JSONValue::MakeArray()), "eth_gasPrice");
}

std::string SendRawTransaction(IRpcTransport& transport, const Bytes& rawTx) {
    JSONValue hash = transport.Call("eth_sendRawTransaction", Params({ToHexPrefixed(rawTx)}));
    if (!hash.IsString() || hash.GetString().empty()) {
        TransportError("Unexpected result for eth_sendRawTransaction");
    }
    return hash.GetString();
}

} // namespace rpc
} // namespace ethwallet
