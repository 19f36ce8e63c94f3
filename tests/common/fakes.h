// ETHWALLET - Test Doubles
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Scripted collaborators shared by the wallet, signing, auth and dispatch
// test suites. Each records the calls it received.

#ifndef ETHWALLET_TESTS_COMMON_FAKES_H
#define ETHWALLET_TESTS_COMMON_FAKES_H

#include "ethwallet/core/errors.h"
#include "ethwallet/auth/siwe.h"
#include "ethwallet/core/json.h"
#include "ethwallet/core/units.h"
#include "ethwallet/dispatch/dispatcher.h"
#include "ethwallet/rpc/transport.h"
#include "ethwallet/wallet/bridge_provider.h"
#include "ethwallet/wallet/factory.h"
#include "ethwallet/wallet/smart_provider.h"

#include <deque>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ethwallet {
namespace test {

// ============================================================================
// JSON-RPC
// ============================================================================

/// Transport answering from per-method scripts
class FakeRpcTransport : public rpc::IRpcTransport {
public:
    /// Answer every call to `method` with `result`
    void Respond(const std::string& method, const JSONValue& result) {
        fixed_[method] = result;
    }

    /// Answer the next call to `method` with `result`, ahead of Respond()
    void Queue(const std::string& method, const JSONValue& result) {
        queued_[method].push_back(result);
    }

    /// Make calls to `method` throw TransportFailure
    void Fail(const std::string& method) { failing_.insert(method); }

    JSONValue Call(const std::string& method, const JSONValue& params) override {
        calls_.emplace_back(method, params);
        if (failing_.count(method)) {
            throw WalletError(ErrorCode::TransportFailure, "scripted failure: " + method);
        }
        auto q = queued_.find(method);
        if (q != queued_.end() && !q->second.empty()) {
            JSONValue result = q->second.front();
            q->second.pop_front();
            return result;
        }
        auto f = fixed_.find(method);
        if (f != fixed_.end()) {
            return f->second;
        }
        throw WalletError(ErrorCode::TransportFailure, "unscripted method: " + method);
    }

    size_t CallCount(const std::string& method) const {
        size_t n = 0;
        for (const auto& call : calls_) {
            if (call.first == method) ++n;
        }
        return n;
    }

    /// Params of the most recent call to `method` (Null if never called)
    JSONValue LastParams(const std::string& method) const {
        for (auto it = calls_.rbegin(); it != calls_.rend(); ++it) {
            if (it->first == method) return it->second;
        }
        return JSONValue();
    }

    const std::vector<std::pair<std::string, JSONValue>>& Calls() const { return calls_; }

private:
    std::map<std::string, JSONValue> fixed_;
    std::map<std::string, std::deque<JSONValue>> queued_;
    std::set<std::string> failing_;
    std::vector<std::pair<std::string, JSONValue>> calls_;
};

/// A mined receipt with status 0x1
inline JSONValue MinedReceipt(const std::string& txHash, const std::string& from,
                              const std::string& to) {
    JSONValue receipt = JSONValue::MakeObject();
    receipt["transactionHash"] = txHash;
    receipt["from"] = from;
    receipt["to"] = to;
    receipt["transactionIndex"] = "0x3";
    receipt["gasUsed"] = "0x5208";
    receipt["blockHash"] = "0x" + std::string(64, 'b');
    receipt["status"] = "0x1";
    return receipt;
}

/// Node script for a local-key transfer: gas price, nonce, chain id, submit, receipt
inline void ScriptNodeForTransfer(FakeRpcTransport& node, ChainId chainId,
                                  const std::string& txHash, const std::string& from,
                                  const std::string& to) {
    node.Respond("eth_gasPrice", JSONValue("0x4a817c800"));
    node.Respond("eth_getTransactionCount", JSONValue("0x9"));
    node.Respond("eth_chainId", JSONValue(DecimalToHexQuantity(std::to_string(chainId))));
    node.Respond("eth_sendRawTransaction", JSONValue(txHash));
    node.Respond("eth_getTransactionReceipt", MinedReceipt(txHash, from, to));
}

// ============================================================================
// Host Bridge
// ============================================================================

class FakeBridge : public wallet::IBridge {
public:
    explicit FakeBridge(std::string address) : address_(std::move(address)) {}

    std::string Connect(const wallet::WalletConnection& connection) override {
        lastConnection = connection.ToJSON();
        ++connects;
        return address_;
    }

    void Disconnect() override { ++disconnects; }

    void SwitchNetwork(ChainId chainId) override { switchedTo = chainId; }

    void FundWallet(const wallet::FundWalletOptions& options) override {
        lastFund = options.ToJSON();
    }

    JSONValue InvokeRoute(const std::string& route, const std::vector<std::string>& args) override {
        invocations.emplace_back(route, args);
        if (failing.count(route)) {
            throw WalletError(ErrorCode::TransportFailure, "bridge failure: " + route);
        }
        auto it = responses.find(route);
        if (it == responses.end()) {
            throw WalletError(ErrorCode::TransportFailure, "unscripted route: " + route);
        }
        return it->second;
    }

    /// Arguments of the most recent invocation of `route`
    std::vector<std::string> LastArgs(const std::string& route) const {
        for (auto it = invocations.rbegin(); it != invocations.rend(); ++it) {
            if (it->first == route) return it->second;
        }
        return {};
    }

    std::map<std::string, JSONValue> responses;
    std::set<std::string> failing;
    std::vector<std::pair<std::string, std::vector<std::string>>> invocations;
    JSONValue lastConnection;
    JSONValue lastFund;
    ChainId switchedTo{0};
    int connects{0};
    int disconnects{0};

private:
    std::string address_;
};

// ============================================================================
// Smart Accounts
// ============================================================================

class FakeSmartAccountBackend : public wallet::ISmartAccountBackend {
public:
    explicit FakeSmartAccountBackend(std::string accountAddress)
        : accountAddress_(std::move(accountAddress)) {}

    std::string GetAccountAddress(const std::string& signerAddress, ChainId chainId) override {
        lastSigner = signerAddress;
        lastChainId = chainId;
        return accountAddress_;
    }

    std::string Execute(const std::string& accountAddress, const wallet::TransactionRequest& request,
                        wallet::IWalletProvider& signer) override {
        executedFrom = accountAddress;
        executedTo = request.to;
        executedValue = request.value;
        // Authorize with the personal signer the way a bundler would
        authorization = signer.PersonalSign("execute:" + request.to);
        return txHash;
    }

    std::string txHash{"0x" + std::string(64, 'e')};
    std::string lastSigner;
    ChainId lastChainId{0};
    std::string executedFrom;
    std::string executedTo;
    std::string executedValue;
    std::string authorization;

private:
    std::string accountAddress_;
};

// ============================================================================
// Tokens
// ============================================================================

class FakeTokenTransfer : public dispatch::ITokenTransfer {
public:
    wallet::TransactionResult Transfer(const std::string& currencyAddress, const std::string& to,
                                       const std::string& amount) override {
        transfers.push_back({currencyAddress, to, amount});
        wallet::TransactionResult result;
        result.id = "1";
        result.receipt.to = currencyAddress;
        return result;
    }

    wallet::CurrencyValue BalanceOf(const std::string& currencyAddress,
                                    const std::string& owner) override {
        lastBalanceQuery = {currencyAddress, owner};
        wallet::CurrencyValue cv;
        cv.name = "Test Token";
        cv.symbol = "TT";
        cv.decimals = 6;
        cv.value = "2500000";
        cv.displayValue = "2.5";
        return cv;
    }

    struct TransferCall {
        std::string currency;
        std::string to;
        std::string amount;
    };

    std::vector<TransferCall> transfers;
    std::pair<std::string, std::string> lastBalanceQuery;
};

// ============================================================================
// Provider Dependencies
// ============================================================================

/// Local keystore under dataDir with cheap scrypt work factors
inline wallet::ProviderDependencies FastLocalDependencies(const std::string& dataDir) {
    wallet::ProviderDependencies deps;
    deps.keystore.dataDir = dataDir;
    deps.keystore.scrypt.n = 1024;
    deps.keystore.scrypt.r = 1;
    deps.keystore.scrypt.p = 1;
    deps.keystore.deviceId = "test-device";
    return deps;
}

// ============================================================================
// Registry
// ============================================================================

class DenyAllUserRegistry : public auth::IUserRegistry {
public:
    bool IsRegistered(const auth::SiweMessage&) override { return false; }
};

} // namespace test
} // namespace ethwallet

#endif // ETHWALLET_TESTS_COMMON_FAKES_H
