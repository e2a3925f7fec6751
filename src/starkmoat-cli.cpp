// STARKMOAT Command-Line Tool
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// Member and admin tooling for STARKMOAT:
// - Generating member secrets and leaves
// - Deriving nullifiers for an action context
// - Initializing and rotating the group root registry
// - Inspecting registry state and history

#include <starkmoat/core/hex.h>
#include <starkmoat/crypto/felt.h>
#include <starkmoat/db/database.h>
#include <starkmoat/identity/nullifier.h>
#include <starkmoat/identity/signal.h>
#include <starkmoat/registry/rootregistry.h>
#include <starkmoat/util/config.h>
#include <starkmoat/util/logging.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace starkmoat;
using namespace starkmoat::util;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* REGISTRY_DIR = "registry";

/// Print horizontal line
void PrintLine(char c = '-', int width = 60) {
    std::cout << std::string(width, c) << "\n";
}

/// Parse a felt argument, reporting what was wrong with it
std::optional<Felt> ParseFeltArg(const std::string& what, const std::string& text) {
    auto value = Felt::FromHex(text);
    if (!value) {
        std::cerr << "Error: " << what << " must be a hex field element below P, got '"
                  << text << "'\n";
    }
    return value;
}

// ============================================================================
// Registry Storage
// ============================================================================

/// Owns the database the registry is stored in
struct OpenRegistry {
    std::unique_ptr<db::Database> db;
    std::unique_ptr<registry::RootRegistry> registry;
};

std::optional<OpenRegistry> LoadRegistry(const ConfigManager& config) {
    fs::path path = fs::path(config.GetDataDir()) / REGISTRY_DIR;
    
    auto [status, database] = db::OpenDatabase(path);
    if (!status.ok()) {
        std::cerr << "Error: cannot open registry at " << path.string() << ": "
                  << status.ToString() << "\n";
        return std::nullopt;
    }
    
    OpenRegistry open;
    open.db = std::move(database);
    open.registry = std::make_unique<registry::RootRegistry>(*open.db);
    
    registry::RegistryStatus loaded = open.registry->Load();
    if (loaded != registry::RegistryStatus::Ok) {
        std::cerr << "Error: registry at " << path.string() << " is unreadable ("
                  << registry::RegistryStatusToString(loaded) << ")\n";
        return std::nullopt;
    }
    
    LOG_DEBUG(LogCategory::CLI) << "Using registry at " << path.string();
    return std::optional<OpenRegistry>(std::move(open));
}

// ============================================================================
// Member Commands
// ============================================================================

int CommandSecret() {
    auto credential = identity::MemberCredential::Generate();
    
    std::cout << "Secret (private): " << credential.secret.ToHex() << "\n";
    std::cout << "Leaf (share for Merkle tree): " << credential.leaf.ToHex() << "\n";
    std::cout << "\nKeep the secret private. Only the leaf is shared for enrollment.\n";
    return 0;
}

int CommandLeaf(const std::string& secretText) {
    if (secretText.empty()) {
        std::cerr << "Usage: starkmoat-cli leaf <secret>\n";
        return 1;
    }
    auto secret = ParseFeltArg("secret", secretText);
    if (!secret) {
        return 1;
    }
    
    std::cout << identity::DeriveLeaf(*secret).ToHex() << "\n";
    return 0;
}

int CommandNullifier(const ConfigManager& config, const std::string& secretText) {
    if (secretText.empty()) {
        std::cerr << "Usage: starkmoat-cli nullifier <secret> --domain=.. --action=.. "
                     "--root=.. --actor=..\n";
        return 1;
    }
    auto secret = ParseFeltArg("secret", secretText);
    if (!secret) {
        return 1;
    }
    
    identity::ActionContext context;
    context.domain = config.GetString(ConfigKeys::DOMAIN, "");
    context.action = config.GetString(ConfigKeys::ACTION, "");
    context.root = config.GetString(ConfigKeys::ROOT, "");
    context.actor = config.GetString(ConfigKeys::ACTOR, "");
    
    if (context.action.empty() || context.root.empty() || context.actor.empty()) {
        std::cerr << "Error: action, root and actor must all be set "
                     "(command line or starkmoat.conf)\n";
        return 1;
    }
    if (context.HasAmbiguousField()) {
        LOG_WARN(LogCategory::CLI) << "Action, root or actor contains '"
                                   << identity::HASH_SEPARATOR
                                   << "'; the context may collide with another one";
    }
    
    Felt actionHash = identity::DeriveActionHash(context);
    Felt nullifier = identity::DeriveNullifier(*secret, actionHash);
    
    PrintLine();
    std::cout << "Domain:      " << context.domain << "\n";
    std::cout << "Action:      " << context.action << "\n";
    std::cout << "Root:        " << context.root << "\n";
    std::cout << "Actor:       " << context.actor << "\n";
    PrintLine();
    std::cout << "Action hash: " << actionHash.ToHex() << "\n";
    std::cout << "Nullifier:   " << nullifier.ToHex() << "\n";
    return 0;
}

// ============================================================================
// Registry Commands
// ============================================================================

int CommandRegistryWrite(const ConfigManager& config, bool initialize,
                         const std::string& rootText) {
    const char* name = initialize ? "init" : "set";
    auto callerText = config.TryGetString("caller");
    if (rootText.empty() || !callerText) {
        std::cerr << "Usage: starkmoat-cli registry " << name << " <root> --caller=<id>\n";
        return 1;
    }
    
    auto root = ParseFeltArg("root", rootText);
    auto caller = ParseFeltArg("caller", *callerText);
    if (!root || !caller) {
        return 1;
    }
    
    auto open = LoadRegistry(config);
    if (!open) {
        return 1;
    }
    
    registry::RegistryStatus status = initialize
        ? open->registry->Initialize(*caller, *root)
        : open->registry->SetRoot(*caller, *root);
    
    if (status != registry::RegistryStatus::Ok) {
        std::cerr << "Error: registry " << name << " failed: "
                  << registry::RegistryStatusToString(status) << "\n";
        return 1;
    }
    
    std::cout << "Current root: " << open->registry->GetCurrentRoot().ToHex() << "\n";
    return 0;
}

int CommandRegistryRead(const ConfigManager& config, const std::string& subcommand,
                        const std::string& arg) {
    if (subcommand == "accepted" && arg.empty()) {
        std::cerr << "Usage: starkmoat-cli registry accepted <root>\n";
        return 1;
    }
    
    auto open = LoadRegistry(config);
    if (!open) {
        return 1;
    }
    const registry::RootRegistry& reg = *open->registry;
    
    if (subcommand == "current") {
        std::cout << reg.GetCurrentRoot().ToHex() << "\n";
        return 0;
    }
    
    if (subcommand == "accepted") {
        auto root = ParseFeltArg("root", arg);
        if (!root) {
            return 1;
        }
        bool accepted = reg.IsRootAccepted(*root);
        std::cout << (accepted ? "accepted" : "not accepted") << "\n";
        return accepted ? 0 : 1;
    }
    
    if (subcommand == "admin") {
        auto admin = reg.GetAdmin();
        if (!admin) {
            std::cerr << "Registry is not initialized\n";
            return 1;
        }
        std::cout << admin->ToHex() << "\n";
        return 0;
    }
    
    if (subcommand == "history") {
        auto transitions = reg.GetTransitions();
        if (transitions.empty()) {
            std::cout << "No root transitions yet.\n";
            return 0;
        }
        PrintLine();
        for (const auto& t : transitions) {
            std::cout << "#" << t.sequence << "  "
                      << ShortHex(t.previousRoot.ToHex()) << " -> " << t.newRoot.ToHex()
                      << "  by " << ShortHex(t.updatedBy.ToHex()) << "\n";
        }
        PrintLine();
        std::cout << transitions.size() << " transition(s), "
                  << reg.GetAcceptedRoots().size() << " accepted root(s)\n";
        return 0;
    }
    
    std::cerr << "Unknown registry subcommand: " << subcommand << "\n";
    return 1;
}

// ============================================================================
// Help and Usage
// ============================================================================

void PrintUsage() {
    std::cout << "STARKMOAT Command-Line Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: starkmoat-cli <command> [options]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  secret                     Generate a member secret and its leaf\n";
    std::cout << "  leaf <secret>              Derive the leaf for a secret\n";
    std::cout << "  nullifier <secret>         Derive the nullifier for an action context\n";
    std::cout << "  registry init <root>       Initialize the registry (caller becomes admin)\n";
    std::cout << "  registry set <root>        Rotate the current root (admin only)\n";
    std::cout << "  registry current           Show the current root\n";
    std::cout << "  registry accepted <root>   Check whether a root was ever accepted\n";
    std::cout << "  registry admin             Show the admin identity\n";
    std::cout << "  registry history           List root transitions\n";
    std::cout << "  help                       Show this help message\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --datadir=<dir>      Data directory (default: ~/.starkmoat)\n";
    std::cout << "  --caller=<id>        Calling account for registry init/set\n";
    std::cout << "  --domain=<text>      Domain separator for nullifiers\n";
    std::cout << "  --action=<text>      Action label\n";
    std::cout << "  --root=<hex>         Root the action is made against\n";
    std::cout << "  --actor=<text>       On-chain actor identifier\n";
    std::cout << "  --loglevel=<level>   trace, debug, info, warn, error (default: warn)\n";
    std::cout << "  --logfile=<path>     Also write logs to a file\n";
    std::cout << "\n";
    std::cout << "Options may also be set in <datadir>/starkmoat.conf.\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  starkmoat-cli secret\n";
    std::cout << "  starkmoat-cli registry init 0x11 --caller=0xabc\n";
    std::cout << "  starkmoat-cli nullifier 0x1234abcd --domain=SN_SEPOLIA --action=signal:vote "
                 "--root=0x11 --actor=0xabc\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << "STARKMOAT Command-Line Tool v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 STARKMOAT Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Setup
// ============================================================================

bool InitLogging(const ConfigManager& config) {
    LogSettings settings;
    settings.printToConsole = config.GetBool(ConfigKeys::PRINTTOCONSOLE, true);
    settings.logFile = config.GetPath(ConfigKeys::LOGFILE);
    
    std::string levelText = config.GetString(ConfigKeys::LOGLEVEL, "warn");
    auto level = ParseLogLevel(levelText);
    if (!level) {
        std::cerr << "Error: unknown log level '" << levelText << "'\n";
        return false;
    }
    settings.level = *level;
    
    if (!SetupLogging(settings)) {
        std::cerr << "Warning: cannot open log file " << settings.logFile << "\n";
    }
    return true;
}

// ============================================================================
// Main
// ============================================================================

int Run(int argc, char* argv[]) {
    ConfigManager config;
    std::vector<std::string> args;
    
    auto parsed = config.ParseCommandLine(argc, argv, &args);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.Describe() << "\n";
        return 1;
    }
    
    if (config.GetBool("version", false) || config.GetBool("v", false)) {
        PrintVersion();
        return 0;
    }
    
    bool help = config.GetBool("help", false) || config.GetBool("h", false);
    if (help || args.empty() || args[0] == "help") {
        PrintUsage();
        return (help || !args.empty()) ? 0 : 1;
    }
    
    parsed = config.LoadConfigFile();
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.Describe() << "\n";
        return 1;
    }
    
    if (!InitLogging(config)) {
        return 1;
    }
    
    for (const char* key : {ConfigKeys::DATADIR, ConfigKeys::DOMAIN, ConfigKeys::ROOT,
                            ConfigKeys::ACTOR, ConfigKeys::ACTION, ConfigKeys::LOGLEVEL,
                            ConfigKeys::LOGFILE, ConfigKeys::PRINTTOCONSOLE}) {
        config.AllowKey(key);
    }
    config.AllowKey("caller");
    for (const auto& warning : config.Validate()) {
        LOG_WARN(LogCategory::CLI) << warning;
    }
    
    const std::string& command = args[0];
    std::string sub = args.size() > 1 ? args[1] : "";
    std::string arg = args.size() > 2 ? args[2] : "";
    
    // Route to command
    if (command == "secret") {
        return CommandSecret();
    } else if (command == "leaf") {
        return CommandLeaf(sub);
    } else if (command == "nullifier") {
        return CommandNullifier(config, sub);
    } else if (command == "registry") {
        if (sub == "init" || sub == "set") {
            return CommandRegistryWrite(config, sub == "init", arg);
        } else if (sub.empty()) {
            std::cerr << "Usage: starkmoat-cli registry <init|set|current|accepted|admin|history>\n";
            return 1;
        }
        return CommandRegistryRead(config, sub, arg);
    }
    
    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'starkmoat-cli help' for usage.\n";
    return 1;
}

int main(int argc, char* argv[]) {
    try {
        int rc = Run(argc, argv);
        Logger::Instance().Flush();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
