// ETHWALLET Command-Line Tool
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Local account management and signing from the shell.
// Supports:
// - Unlock-or-create of the local keystore account
// - Keystore export and deletion
// - Personal signing and signer recovery
// - Sign-in challenge issuance with local verification
// - Native balance lookup over JSON-RPC

#include <ethwallet/core/errors.h>
#include <ethwallet/rpc/transport.h>
#include <ethwallet/util/config.h>
#include <ethwallet/util/logging.h>
#include <ethwallet/wallet/factory.h>
#include <ethwallet/wallet/session.h>
#include <ethwallet/wallet/wallet.h>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ethwallet;
using namespace ethwallet::wallet;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Setup
// ============================================================================

void SetupLogging(const util::WalletSettings& settings) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(settings.logLevel);
    logger.SetLevel(level);

    util::ConsoleSink::Config consoleConfig;
    consoleConfig.level = level;
    consoleConfig.useStderr = true;
    consoleConfig.showTimestamp = false;
    logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));

    if (!settings.logFile.empty()) {
        logger.AddSink(std::make_shared<util::FileSink>(
            util::ConfigManager::ExpandTilde(settings.logFile), util::LogLevel::Debug));
    }
}

ProviderDependencies MakeDependencies(const util::WalletSettings& settings) {
    ProviderDependencies deps;
    deps.keystore.dataDir = settings.dataDir;
    deps.keystore.scrypt.n = settings.scryptN;
    deps.keystore.scrypt.r = settings.scryptR;
    deps.keystore.scrypt.p = settings.scryptP;
    deps.keystore.deviceId = settings.deviceId;
    deps.receiptPolling.intervalMs = settings.receiptPollIntervalMs;
    deps.receiptPolling.maxAttempts = settings.receiptMaxAttempts;
    return deps;
}

/// Wallet over a local-account session; the node transport is optional
std::unique_ptr<Wallet> OpenWallet(const util::WalletSettings& settings, rpc::RpcTransportPtr rpc) {
    auto factory = std::make_shared<ProviderFactory>(MakeDependencies(settings));
    auto session = std::make_shared<WalletSession>(factory, std::move(rpc), settings.chainId);
    auth::Authenticator::Options authOptions;
    authOptions.expirySeconds = settings.siweExpirySeconds;
    return std::make_unique<Wallet>(session, nullptr, nullptr, authOptions);
}

WalletConnection LocalConnection(const util::WalletSettings& settings, const std::string& password) {
    WalletConnection conn;
    conn.provider = WalletProvider::LocalWallet;
    conn.chainId = settings.chainId;
    if (!password.empty()) {
        conn.password = password;
    }
    return conn;
}

// ============================================================================
// Commands
// ============================================================================

int CommandAddress(Wallet& w, const WalletConnection& conn) {
    std::cout << w.Connect(conn) << "\n";
    return 0;
}

int CommandExport(Wallet& w, const WalletConnection& conn) {
    w.Connect(conn);
    std::cout << JSONValue::Parse(w.Export(conn.password.value_or(""))).ToJSON(true) << "\n";
    return 0;
}

int CommandSign(Wallet& w, const WalletConnection& conn, const std::string& message) {
    w.Connect(conn);
    std::cout << w.Sign(message) << "\n";
    return 0;
}

int CommandRecover(Wallet& w, const std::string& message, const std::string& signature) {
    std::cout << w.RecoverAddress(message, signature) << "\n";
    return 0;
}

int CommandLogin(Wallet& w, const WalletConnection& conn, const std::string& domain) {
    w.Connect(conn);
    auth::LoginPayload payload = w.Authenticate(domain);
    std::cout << payload.ToJSON().ToJSON(true) << "\n";

    auth::VerifyResult result = w.Verify(payload);
    std::cout << "Verification: " << result.ToString() << "\n";
    return result.IsAuthenticated() ? 0 : 1;
}

int CommandBalance(Wallet& w, const WalletConnection& conn) {
    std::string address = w.Connect(conn);
    CurrencyValue balance = w.GetBalance();
    std::cout << address << ": " << balance.displayValue << " " << balance.symbol
              << " (" << balance.value << " wei)\n";
    return 0;
}

int CommandDelete(Wallet& w) {
    if (!w.DeleteLocalAccount()) {
        std::cerr << "Error: could not delete the stored account\n";
        return 1;
    }
    std::cout << "Local account deleted\n";
    return 0;
}

// ============================================================================
// Usage
// ============================================================================

void PrintUsage() {
    std::cout << "ETHWALLET Command-Line Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: ethwallet-cli [options] <command> [args]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  address                  Unlock or create the local account, print its address\n";
    std::cout << "  export                   Print the V3 keystore JSON of the local account\n";
    std::cout << "  sign <message>           Personal-sign a message\n";
    std::cout << "  recover <message> <sig>  Recover the signer address\n";
    std::cout << "  login <domain>           Issue a sign-in payload and verify it locally\n";
    std::cout << "  balance                  Native balance via -rpcurl\n";
    std::cout << "  delete                   Delete the stored account\n";
    std::cout << "  help                     Show this help message\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -datadir=<dir>    Data directory (default: " << util::DEFAULT_DATADIR << ")\n";
    std::cout << "  -conf=<file>      Configuration file (default: <datadir>/"
              << util::DEFAULT_CONFIG_FILENAME << ")\n";
    std::cout << "  -password=<pw>    Keystore password (default: device identifier)\n";
    std::cout << "  -chainid=<n>      Chain id (default: 1)\n";
    std::cout << "  -rpcurl=<url>     JSON-RPC endpoint (default: http://127.0.0.1:8545)\n";
    std::cout << "  -loglevel=<lvl>   trace, debug, info, warn, error\n";
    std::cout << "  -version          Print version and exit\n";
    std::cout << "\n";
}

bool RequireArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() < count + 1) {
        std::cerr << "Usage: ethwallet-cli " << usage << "\n";
        return false;
    }
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    util::ConfigManager config;
    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << "\n";
        return 1;
    }

    if (config.GetBool("version", false)) {
        std::cout << "ethwallet-cli v" << VERSION << "\n";
        return 0;
    }

    const std::vector<std::string>& args = config.GetPositionalArgs();
    if (config.GetBool("help", false) || args.empty() || args[0] == "help") {
        PrintUsage();
        return args.empty() && !config.GetBool("help", false) ? 1 : 0;
    }

    util::ConfigParseResult loaded = config.LoadConfigFile();
    if (!loaded.success) {
        std::cerr << "Error: " << loaded.errorMessage << "\n";
        return 1;
    }

    util::WalletSettings settings;
    try {
        settings = util::WalletSettings::Load(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    SetupLogging(settings);

    const std::string& command = args[0];
    const std::string password = config.GetString(util::ConfigKeys::PASSWORD, "");

    try {
        rpc::RpcTransportPtr rpc;
        if (command == "balance") {
            rpc = std::make_shared<rpc::HttpRpcTransport>(settings.rpcUrl);
        }
        std::unique_ptr<Wallet> w = OpenWallet(settings, rpc);
        WalletConnection conn = LocalConnection(settings, password);

        if (command == "address") {
            return CommandAddress(*w, conn);
        } else if (command == "export") {
            return CommandExport(*w, conn);
        } else if (command == "sign") {
            if (!RequireArgs(args, 1, "sign <message>")) return 1;
            return CommandSign(*w, conn, args[1]);
        } else if (command == "recover") {
            if (!RequireArgs(args, 2, "recover <message> <signature>")) return 1;
            return CommandRecover(*w, args[1], args[2]);
        } else if (command == "login") {
            if (!RequireArgs(args, 1, "login <domain>")) return 1;
            return CommandLogin(*w, conn, args[1]);
        } else if (command == "balance") {
            return CommandBalance(*w, conn);
        } else if (command == "delete") {
            return CommandDelete(*w);
        }

        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Run 'ethwallet-cli help' for usage.\n";
        return 1;
    } catch (const WalletError& e) {
        std::cerr << "Error (" << ErrorCodeToString(e.Code()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
