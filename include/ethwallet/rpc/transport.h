// ETHWALLET - JSON-RPC Transport
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// JSON-RPC 2.0 transport to an Ethereum node.
//
// Features:
// - Abstract transport interface (fakes in tests)
// - HTTP/1.1 transport over plain sockets, one connection per call
// - Receipt polling with an attempt limit
// - Typed helpers for the handful of eth_* methods the wallet consumes

#ifndef ETHWALLET_RPC_TRANSPORT_H
#define ETHWALLET_RPC_TRANSPORT_H

#include "ethwallet/core/json.h"
#include "ethwallet/core/types.h"
#include "ethwallet/wallet/transaction.h"

#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>

namespace ethwallet {
namespace rpc {

// ============================================================================
// Transport Interface
// ============================================================================

/**
 * Request channel to a node or signer.
 */
class IRpcTransport {
public:
    virtual ~IRpcTransport() = default;

    /**
     * Invoke a JSON-RPC method.
     *
     * @param method Method name (e.g. "eth_chainId")
     * @param params Positional parameters (array)
     * @return The "result" member of the response
     * @throws WalletError(TransportFailure) on network, HTTP or JSON-RPC errors
     */
    virtual JSONValue Call(const std::string& method, const JSONValue& params) = 0;
};

using RpcTransportPtr = std::shared_ptr<IRpcTransport>;

// ============================================================================
// HTTP Transport
// ============================================================================

/**
 * HTTP transport configuration.
 */
struct HttpTransportConfig {
    /// Server hostname or IP
    std::string host{"127.0.0.1"};

    /// Server port
    uint16_t port{8545};

    /// Request path
    std::string path{"/"};

    /// Connection timeout (seconds)
    int connectTimeout{5};

    /// Request timeout (seconds)
    int requestTimeout{30};

    /// Parse "http://host[:port][/path]"
    /// @throws std::invalid_argument for other schemes or malformed URLs
    static HttpTransportConfig FromUrl(const std::string& url);
};

/**
 * JSON-RPC 2.0 over HTTP/1.1 POST.
 */
class HttpRpcTransport : public IRpcTransport {
public:
    explicit HttpRpcTransport(const HttpTransportConfig& config);
    explicit HttpRpcTransport(const std::string& url);

    // Non-copyable
    HttpRpcTransport(const HttpRpcTransport&) = delete;
    HttpRpcTransport& operator=(const HttpRpcTransport&) = delete;

    JSONValue Call(const std::string& method, const JSONValue& params) override;

    const HttpTransportConfig& GetConfig() const { return config_; }

    /// Get total calls made
    uint64_t GetTotalCalls() const { return totalCalls_; }

    /// Get total errors
    uint64_t GetTotalErrors() const { return totalErrors_; }

    /// Build the HTTP request for a body
    std::string BuildHTTPRequest(const std::string& body) const;

    /**
     * Split a raw HTTP response into status code and body, decoding
     * chunked transfer encoding.
     * @return false if the response is malformed
     */
    static bool ParseHTTPResponse(const std::string& raw, std::string& body, int& statusCode);

    /**
     * Extract the result of a JSON-RPC response body.
     * @throws WalletError(TransportFailure) on malformed JSON or an error member
     */
    static JSONValue ExtractResult(const std::string& body);

private:
    /// Connect, send, receive; the socket is closed before returning
    std::string SendRequest(const std::string& request);

    HttpTransportConfig config_;
    std::atomic<int64_t> nextId_{1};
    std::atomic<uint64_t> totalCalls_{0};
    std::atomic<uint64_t> totalErrors_{0};
};

// ============================================================================
// Receipt Poller
// ============================================================================

/**
 * Polls eth_getTransactionReceipt until the node reports a receipt.
 */
class ReceiptPoller {
public:
    struct Config {
        int64_t intervalMs{1000};
        uint32_t maxAttempts{120};
    };

    ReceiptPoller(IRpcTransport& transport, const Config& config);

    /**
     * Block until a receipt is observed.
     * @throws WalletError(TransportFailure) after maxAttempts empty polls
     */
    wallet::TransactionResult WaitForReceipt(const std::string& txHash) const;

private:
    IRpcTransport& transport_;
    Config config_;
};

// ============================================================================
// Ethereum Method Helpers
// ============================================================================

/// eth_chainId, parsed
ChainId GetChainId(IRpcTransport& transport);

/// eth_getBalance(address, "latest") as decimal wei
std::string GetBalance(IRpcTransport& transport, const std::string& address);

/// eth_getTransactionCount(address, "pending")
uint64_t GetTransactionCount(IRpcTransport& transport, const std::string& address);

/// eth_gasPrice as decimal wei
std::string GetGasPrice(IRpcTransport& transport);

/// eth_sendRawTransaction; returns the transaction hash
std::string SendRawTransaction(IRpcTransport& transport, const Bytes& rawTx);

/// Build a positional params array from strings
JSONValue Params(std::initializer_list<std::string> values);

} // namespace rpc
} // namespace ethwallet

#endif // ETHWALLET_RPC_TRANSPORT_H
