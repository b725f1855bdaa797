// RISKVAULT Command-Line Tool
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Administers a persistent risk ledger stored in a data directory.
// Supports:
// - Deploying a ledger and inspecting its configuration
// - Owner administration (updaters, pause, limits, validity periods)
// - Passport revocation and transfer
// - Commitment, nullifier and passport lookups
// - Offline commitment derivation and attestor key generation

#include <riskvault/core/hex.h>
#include <riskvault/crypto/commitment.h>
#include <riskvault/crypto/keys.h>
#include <riskvault/util/config.h>
#include <riskvault/util/logging.h>
#include <riskvault/util/time.h>
#include <riskvault/vault/ledger.h>
#include <riskvault/vault/statedb.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace riskvault;
using namespace riskvault::vault;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* STATE_DIR = "state";
constexpr const char* LOG_FILE = "debug.log";

// ============================================================================
// Output Helpers
// ============================================================================

void PrintLine(char c = '-', int width = 60) {
    std::cout << std::string(width, c) << "\n";
}

void PrintHeader(const std::string& title) {
    std::cout << "\n";
    PrintLine('=');
    std::cout << title << "\n";
    PrintLine('=');
}

int ReportError(VaultError err) {
    std::cerr << "Error: " << VaultErrorMessage(err) << " (" << VaultErrorToString(err) << ")\n";
    return 1;
}

int ReportUsage(const std::string& usage) {
    std::cerr << "Usage: riskvault-cli " << usage << "\n";
    return 1;
}

// ============================================================================
// Argument Parsing
// ============================================================================

bool ParseAddress(const std::string& str, Address& out) {
    if (!IsValidHex(str) || StripHexPrefix(str).size() != 2 * Address::SIZE) {
        std::cerr << "Error: Invalid address: " << str << "\n";
        return false;
    }
    out = Address::FromHex(str);
    return true;
}

bool ParseHash(const std::string& str, Hash256& out) {
    if (!IsValidHex(str) || StripHexPrefix(str).size() != 2 * Hash256::SIZE) {
        std::cerr << "Error: Invalid 32-byte hash: " << str << "\n";
        return false;
    }
    out = Hash256::FromHex(str);
    return true;
}

bool ParseInteger(const std::string& str, int64_t& out) {
    try {
        size_t pos = 0;
        out = std::stoll(str, &pos);
        if (pos != str.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid number: " << str << "\n";
        return false;
    }
}

// ============================================================================
// Ledger Access
// ============================================================================

fs::path GetDataDir(const util::ConfigManager& config) {
    return fs::path(config.GetPath(util::ConfigKeys::DATADIR,
                                   util::ConfigManager::GetDefaultDataDir()));
}

/// Caller address from -sender; null if unset or malformed
Address GetSender(const util::ConfigManager& config) {
    Address sender;
    auto str = config.TryGetString(util::ConfigKeys::SENDER);
    if (!str) {
        std::cerr << "Error: This command needs -sender=<address>\n";
        return sender;
    }
    if (!ParseAddress(*str, sender)) {
        return Address();
    }
    return sender;
}

/**
 * Open the ledger stored in the data directory.
 * Throws std::runtime_error if the store cannot be opened or loaded.
 */
std::unique_ptr<RiskLedger> OpenLedger(const util::ConfigManager& config, const Address& deployer,
                                       bool create) {
    fs::path stateDir = GetDataDir(config) / STATE_DIR;
    bool exists = fs::exists(stateDir);
    
    if (create && exists) {
        throw std::runtime_error("Ledger already initialized at " + stateDir.string());
    }
    if (!create && !exists) {
        throw std::runtime_error("No ledger at " + stateDir.string() +
                                 " (run 'riskvault-cli init' first)");
    }
    
    VaultParams params = VaultParams::FromConfig(config);
    auto state = std::make_unique<StateDB>(stateDir);
    return std::make_unique<RiskLedger>(params, deployer, nullptr, std::move(state));
}

std::unique_ptr<RiskLedger> OpenExisting(const util::ConfigManager& config) {
    return OpenLedger(config, Address(), false);
}

// ============================================================================
// Command: Init / Info / Stats
// ============================================================================

int CommandInit(const util::ConfigManager& config) {
    Address deployer = GetSender(config);
    if (deployer.IsNull()) {
        return 1;
    }
    
    auto ledger = OpenLedger(config, deployer, true);
    const Deployment& d = ledger->GetDeployment();
    
    PrintHeader("LEDGER INITIALIZED");
    std::cout << "Network:        " << ledger->GetParams().networkID << "\n";
    std::cout << "Owner:          " << d.deployer.ToString() << "\n";
    std::cout << "Vault:          " << d.vault.ToString() << "\n";
    std::cout << "Registry:       " << d.registry.ToString() << "\n";
    std::cout << "Data directory: " << GetDataDir(config).string() << "\n\n";
    return 0;
}

int CommandInfo(const util::ConfigManager& config) {
    auto ledger = OpenExisting(config);
    const RiskScoreVault& vault = ledger->GetVault();
    const PassportRegistry& registry = ledger->GetRegistry();
    ContractInfo info = vault.GetContractInfo();
    
    PrintHeader("RISK VAULT");
    std::cout << "Network:             " << ledger->GetParams().networkID << "\n";
    std::cout << "Vault address:       " << vault.GetAddress().ToString() << "\n";
    std::cout << "Owner:               " << info.owner.ToString() << "\n";
    std::cout << "Paused:              " << (vault.IsPaused() ? "yes" : "no") << "\n";
    std::cout << "Block number:        " << ledger->GetBlockNumber() << "\n";
    std::cout << "Score precision:     " << info.scorePrecision << "\n";
    std::cout << "Max risk score:      " << info.maxRiskScore << "\n";
    std::cout << "Band table:          " << vault.GetBandThresholds().ToString() << "\n";
    std::cout << "Score validity:      "
              << util::FormatDuration(util::Seconds{info.scoreValidityPeriod}) << "\n";
    std::cout << "Min update interval: "
              << util::FormatDuration(util::Seconds{vault.GetMinUpdateInterval()}) << "\n";
    std::cout << "Daily verifications: " << vault.GetMaxDailyDecryptions() << "\n";
    std::cout << "Scored commitments:  " << info.totalScoredAddresses << "\n";
    std::cout << "Verifications:       " << info.totalDecryptionRequests << "\n";
    std::cout << "Verifier:            " << (vault.HasVerifier() ? "configured" : "none") << "\n";
    
    PrintHeader("PASSPORT REGISTRY");
    std::cout << "Registry address:    " << registry.GetAddress().ToString() << "\n";
    std::cout << "Owner:               " << registry.GetOwner().ToString() << "\n";
    std::cout << "Passport validity:   "
              << util::FormatDuration(util::Seconds{registry.GetValidityPeriod()}) << "\n";
    std::cout << "Total supply:        " << registry.TotalSupply() << "\n\n";
    return 0;
}

int CommandStats(const util::ConfigManager& config) {
    auto ledger = OpenExisting(config);
    ScoreStatistics stats = ledger->GetVault().GetScoreStatistics();
    
    PrintHeader("SCORE STATISTICS");
    for (size_t i = 1; i < NUM_RISK_BANDS; ++i) {
        RiskBand band = static_cast<RiskBand>(i);
        std::cout << "  " << RiskBandToString(band) << ": " << stats.Count(band) << "\n";
    }
    PrintLine();
    std::cout << "  TOTAL: " << stats.total << "\n\n";
    return 0;
}

// ============================================================================
// Command: Administration
// ============================================================================

int CommandAuthorize(const util::ConfigManager& config, const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return ReportUsage("authorize <address> <0|1>");
    }
    Address updater;
    if (!ParseAddress(args[1], updater)) {
        return 1;
    }
    if (args[2] != "0" && args[2] != "1") {
        return ReportUsage("authorize <address> <0|1>");
    }
    Address sender = GetSender(config);
    if (sender.IsNull()) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    bool authorized = args[2] == "1";
    VaultError err = ledger->SetAuthorizedUpdater(sender, updater, authorized);
    if (err != VaultError::None) {
        return ReportError(err);
    }
    std::cout << updater.ToString() << (authorized ? " authorized\n" : " deauthorized\n");
    return 0;
}

int CommandPause(const util::ConfigManager& config, bool pause) {
    Address sender = GetSender(config);
    if (sender.IsNull()) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    VaultError err = pause ? ledger->Pause(sender) : ledger->Unpause(sender);
    if (err != VaultError::None) {
        return ReportError(err);
    }
    std::cout << (pause ? "Vault paused\n" : "Vault unpaused\n");
    return 0;
}

int CommandSetInterval(const util::ConfigManager& config, const std::vector<std::string>& args) {
    int64_t seconds = 0;
    if (args.size() < 2) {
        return ReportUsage("set-interval <seconds>");
    }
    if (!ParseInteger(args[1], seconds)) {
        return 1;
    }
    Address sender = GetSender(config);
    if (sender.IsNull()) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    VaultError err = ledger->SetMinUpdateInterval(sender, seconds);
    if (err != VaultError::None) {
        return ReportError(err);
    }
    std::cout << "Minimum update interval set to "
              << util::FormatDuration(util::Seconds{seconds}) << "\n";
    return 0;
}

int CommandSetDailyLimit(const util::ConfigManager& config, const std::vector<std::string>& args) {
    int64_t limit = 0;
    if (args.size() < 2) {
        return ReportUsage("set-daily-limit <count>");
    }
    if (!ParseInteger(args[1], limit)) {
        return 1;
    }
    if (limit < 0 || limit > UINT32_MAX) {
        return ReportError(VaultError::InvalidLimit);
    }
    Address sender = GetSender(config);
    if (sender.IsNull()) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    VaultError err = ledger->SetMaxDailyDecryptions(sender, static_cast<uint32_t>(limit));
    if (err != VaultError::None) {
        return ReportError(err);
    }
    std::cout << "Daily verification limit set to " << limit << "\n";
    return 0;
}

int CommandSetCustomValidity(const util::ConfigManager& config,
                             const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return ReportUsage("set-custom-validity <commitment> <seconds|0>");
    }
    Hash256 hash;
    int64_t seconds = 0;
    if (!ParseHash(args[1], hash) || !ParseInteger(args[2], seconds)) {
        return 1;
    }
    Address sender = GetSender(config);
    if (sender.IsNull()) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    VaultError err = ledger->SetCustomValidityPeriod(sender, CommitmentHash(hash), seconds);
    if (err != VaultError::None) {
        return ReportError(err);
    }
    if (seconds == 0) {
        std::cout << "Custom validity cleared\n";
    } else {
        std::cout << "Custom validity set to " << util::FormatDuration(util::Seconds{seconds}) << "\n";
    }
    return 0;
}

int CommandSetPassportValidity(const util::ConfigManager& config,
                               const std::vector<std::string>& args) {
    int64_t seconds = 0;
    if (args.size() < 2) {
        return ReportUsage("set-passport-validity <seconds>");
    }
    if (!ParseInteger(args[1], seconds)) {
        return 1;
    }
    Address sender = GetSender(config);
    if (sender.IsNull()) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    VaultError err = ledger->SetPassportValidityPeriod(sender, seconds);
    if (err != VaultError::None) {
        return ReportError(err);
    }
    std::cout << "Passport validity set to " << util::FormatDuration(util::Seconds{seconds}) << "\n";
    return 0;
}

// ============================================================================
// Command: Passports
// ============================================================================

int CommandRevoke(const util::ConfigManager& config, const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return ReportUsage("revoke <token-id> <reason>");
    }
    int64_t id = 0;
    if (!ParseInteger(args[1], id) || id < 0) {
        return 1;
    }
    std::string reason = args[2];
    for (size_t i = 3; i < args.size(); ++i) {
        reason += " " + args[i];
    }
    Address sender = GetSender(config);
    if (sender.IsNull()) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    VaultError err = ledger->RevokePassport(sender, static_cast<TokenId>(id), reason);
    if (err != VaultError::None) {
        return ReportError(err);
    }
    std::cout << "Passport " << id << " revoked\n";
    return 0;
}

int CommandTransfer(const util::ConfigManager& config, const std::vector<std::string>& args) {
    if (args.size() < 4) {
        return ReportUsage("transfer <from> <to> <token-id>");
    }
    Address from, to;
    int64_t id = 0;
    if (!ParseAddress(args[1], from) || !ParseAddress(args[2], to) ||
        !ParseInteger(args[3], id) || id < 0) {
        return 1;
    }
    Address sender = GetSender(config);
    if (sender.IsNull()) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    VaultError err = ledger->TransferFrom(sender, from, to, static_cast<TokenId>(id));
    if (err != VaultError::None) {
        return ReportError(err);
    }
    std::cout << "Passport " << id << " transferred to " << to.ToString() << "\n";
    return 0;
}

int CommandPassport(const util::ConfigManager& config, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return ReportUsage("passport <token-id>");
    }
    int64_t id = 0;
    if (!ParseInteger(args[1], id) || id < 0) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    const PassportRegistry& registry = ledger->GetRegistry();
    auto passport = registry.GetPassport(static_cast<TokenId>(id));
    if (!passport) {
        return ReportError(VaultError::PassportNotFound);
    }
    
    PassportValidity validity = registry.IsPassportValid(static_cast<TokenId>(id), ledger->Now());
    
    PrintHeader("PASSPORT " + std::to_string(id));
    std::cout << "Holder:      " << passport->owner.ToString() << "\n";
    std::cout << "Commitment:  " << passport->commitment.ToHex() << "\n";
    std::cout << "Risk band:   " << RiskBandToString(registry.GetPassportRiskBand(id)) << "\n";
    std::cout << "Minted:      " << util::FormatISO8601(passport->mintTime) << "\n";
    std::cout << "Expires:     " << util::FormatISO8601(passport->expiry) << "\n";
    std::cout << "Valid:       " << (validity.valid ? "yes" : "no") << "\n";
    if (passport->revoked) {
        std::cout << "Revoked:     " << passport->revokeReason << "\n";
    }
    std::cout << "\n";
    return 0;
}

// ============================================================================
// Command: Commitment Lookups
// ============================================================================

int CommandBand(const util::ConfigManager& config, const std::vector<std::string>& args) {
    Hash256 hash;
    if (args.size() < 2) {
        return ReportUsage("band <commitment>");
    }
    if (!ParseHash(args[1], hash)) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    std::cout << RiskBandToString(ledger->GetVault().GetRiskBand(CommitmentHash(hash))) << "\n";
    return 0;
}

int CommandStatus(const util::ConfigManager& config, const std::vector<std::string>& args) {
    Hash256 hash;
    if (args.size() < 2) {
        return ReportUsage("status <commitment>");
    }
    if (!ParseHash(args[1], hash)) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    const RiskScoreVault& vault = ledger->GetVault();
    CommitmentHash commitment(hash);
    ScoreValidity validity = vault.HasValidScore(commitment, ledger->Now());
    
    std::cout << "Exists:   " << (validity.exists ? "yes" : "no") << "\n";
    std::cout << "Valid:    " << (validity.valid ? "yes" : "no") << "\n";
    std::cout << "Validity: "
              << util::FormatDuration(util::Seconds{vault.GetValidityPeriod(commitment)})
              << (vault.GetCustomValidityPeriod(commitment) ? " (custom)" : "") << "\n";
    if (auto token = ledger->GetRegistry().GetTokenByCommitment(commitment)) {
        std::cout << "Passport: " << *token << "\n";
    }
    return 0;
}

int CommandMetadata(const util::ConfigManager& config, const std::vector<std::string>& args) {
    Hash256 hash;
    if (args.size() < 2) {
        return ReportUsage("metadata <commitment>");
    }
    if (!ParseHash(args[1], hash)) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    CommitmentMetadata meta = ledger->GetVault().GetCommitmentMetadata(CommitmentHash(hash));
    if (!meta.exists) {
        return ReportError(VaultError::CommitmentNotFound);
    }
    
    PrintHeader("COMMITMENT");
    std::cout << "Commitment:   " << hash.ToHex() << "\n";
    std::cout << "Recorded:     " << util::FormatISO8601(meta.timestamp) << "\n";
    std::cout << "Block height: " << meta.blockHeight << "\n";
    std::cout << "Risk band:    " << RiskBandToString(meta.band) << "\n";
    std::cout << "Analyzer:     " << meta.analyzer.ToString() << "\n\n";
    return 0;
}

int CommandNullifier(const util::ConfigManager& config, const std::vector<std::string>& args) {
    Hash256 hash;
    if (args.size() < 2) {
        return ReportUsage("nullifier <hash>");
    }
    if (!ParseHash(args[1], hash)) {
        return 1;
    }
    
    auto ledger = OpenExisting(config);
    bool used = ledger->GetVault().IsNullifierUsed(NullifierHash(hash));
    std::cout << (used ? "used" : "unused") << "\n";
    return 0;
}

// ============================================================================
// Command: Offline Tools
// ============================================================================

int CommandCommit(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return ReportUsage("commit <wallet> <secret-hex>");
    }
    Address wallet;
    if (!ParseAddress(args[1], wallet)) {
        return 1;
    }
    if (!IsValidHex(args[2])) {
        std::cerr << "Error: Secret must be hex\n";
        return 1;
    }
    Bytes secret = HexToBytes(args[2]);
    if (secret.empty()) {
        std::cerr << "Error: Secret must not be empty\n";
        return 1;
    }
    
    CommitmentHash commitment = crypto::DeriveCommitment(wallet, secret);
    NullifierHash nullifier = crypto::DeriveNullifier(secret, commitment);
    std::cout << "Commitment: " << commitment.ToHex() << "\n";
    std::cout << "Nullifier:  " << nullifier.ToHex() << "\n";
    return 0;
}

int CommandKeygen() {
    crypto::PrivateKey key = crypto::PrivateKey::Generate();
    crypto::PublicKey pub = key.GetPublicKey();
    
    PrintHeader("ATTESTOR KEY");
    std::cout << "Private key: " << key.ToHex() << "\n";
    std::cout << "Public key:  " << pub.ToHex() << "\n";
    std::cout << "Address:     " << pub.GetAddress().ToString() << "\n\n";
    std::cout << "Keep the private key offline; only the public key belongs in the\n"
              << "verifier configuration.\n\n";
    return 0;
}

// ============================================================================
// Help and Usage
// ============================================================================

void PrintUsage() {
    std::cout << "RiskVault Command-Line Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: riskvault-cli [options] <command> [args]\n";
    std::cout << "\n";
    std::cout << "Ledger commands:\n";
    std::cout << "  init                               Deploy a new ledger (owner = -sender)\n";
    std::cout << "  info                               Show vault and registry configuration\n";
    std::cout << "  stats                              Show per-band statistics\n";
    std::cout << "  band <commitment>                  Show the risk band of a commitment\n";
    std::cout << "  status <commitment>                Show existence and validity\n";
    std::cout << "  metadata <commitment>              Show attestation metadata\n";
    std::cout << "  nullifier <hash>                   Check whether a nullifier is used\n";
    std::cout << "  passport <id>                      Show a passport\n";
    std::cout << "\n";
    std::cout << "Owner commands (require -sender):\n";
    std::cout << "  authorize <address> <0|1>          Authorize or deauthorize an updater\n";
    std::cout << "  pause | unpause                    Toggle the emergency stop\n";
    std::cout << "  set-interval <seconds>             Minimum interval between submissions\n";
    std::cout << "  set-daily-limit <count>            Threshold verifications per day\n";
    std::cout << "  set-custom-validity <c> <seconds>  Per-commitment validity (0 clears)\n";
    std::cout << "  set-passport-validity <seconds>    Lifetime of new passports\n";
    std::cout << "  revoke <id> <reason>               Revoke a passport\n";
    std::cout << "\n";
    std::cout << "Holder commands (require -sender):\n";
    std::cout << "  transfer <from> <to> <id>          Transfer a passport\n";
    std::cout << "\n";
    std::cout << "Offline tools:\n";
    std::cout << "  commit <wallet> <secret-hex>       Derive commitment and nullifier\n";
    std::cout << "  keygen                             Generate an attestor key pair\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -datadir=<dir>     Data directory (default: ~/.riskvault)\n";
    std::cout << "  -conf=<file>       Configuration file (default: <datadir>/riskvault.conf)\n";
    std::cout << "  -network=<name>    main, test or regtest\n";
    std::cout << "  -sender=<address>  Caller of owner and holder commands\n";
    std::cout << "  -debug             Verbose logging\n";
    std::cout << "  -printtoconsole    Log to the console as well as debug.log\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << "RiskVault Command-Line Tool v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 RiskVault Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Setup
// ============================================================================

bool LoadConfigFile(util::ConfigManager& config) {
    fs::path confPath;
    bool explicitConf = config.HasKey(util::ConfigKeys::CONF);
    if (explicitConf) {
        confPath = config.GetPath(util::ConfigKeys::CONF);
    } else {
        confPath = GetDataDir(config) / util::DEFAULT_CONFIG_FILENAME;
    }
    
    if (!fs::exists(confPath)) {
        if (explicitConf) {
            std::cerr << "Error: Config file not found: " << confPath.string() << "\n";
            return false;
        }
        return true;
    }
    
    // Command-line values take precedence over the file
    util::ConfigManager fileConfig;
    util::ConfigParseResult result = fileConfig.ParseFile(confPath.string());
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage;
        if (result.errorLine > 0) {
            std::cerr << " (" << result.errorFile << ":" << result.errorLine << ")";
        }
        std::cerr << "\n";
        return false;
    }
    for (const char* key : {util::ConfigKeys::NETWORK, util::ConfigKeys::SENDER,
                            util::ConfigKeys::DEBUG, util::ConfigKeys::PRINTTOCONSOLE,
                            util::ConfigKeys::LOGLEVEL,
                            util::ConfigKeys::MIN_UPDATE_INTERVAL,
                            util::ConfigKeys::MAX_DAILY_DECRYPTIONS,
                            util::ConfigKeys::SCORE_VALIDITY,
                            util::ConfigKeys::PASSPORT_VALIDITY,
                            util::ConfigKeys::BANDS,
                            util::ConfigKeys::GENESIS_HEIGHT}) {
        if (auto value = fileConfig.TryGetString(key)) {
            config.SetDefault(key, *value);
        }
    }
    return true;
}

void SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    
    util::LogLevel level = config.GetBool(util::ConfigKeys::DEBUG, false)
        ? util::LogLevel::Debug
        : util::LogLevelFromString(config.GetString(util::ConfigKeys::LOGLEVEL, "warn"));
    logger.SetLevel(level);
    
    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false)) {
        logger.AddSink(std::make_shared<util::ConsoleSink>(level));
    }
    
    fs::path dataDir = GetDataDir(config);
    if (fs::exists(dataDir)) {
        auto file = std::make_shared<util::FileSink>((dataDir / LOG_FILE).string(), level);
        if (file->IsOpen()) {
            logger.AddSink(file);
        }
    }
}

// ============================================================================
// Main
// ============================================================================

int Dispatch(const util::ConfigManager& config, const std::vector<std::string>& args) {
    const std::string& command = args[0];
    
    if (command == "init") {
        return CommandInit(config);
    } else if (command == "info") {
        return CommandInfo(config);
    } else if (command == "stats") {
        return CommandStats(config);
    } else if (command == "authorize") {
        return CommandAuthorize(config, args);
    } else if (command == "pause") {
        return CommandPause(config, true);
    } else if (command == "unpause") {
        return CommandPause(config, false);
    } else if (command == "set-interval") {
        return CommandSetInterval(config, args);
    } else if (command == "set-daily-limit") {
        return CommandSetDailyLimit(config, args);
    } else if (command == "set-custom-validity") {
        return CommandSetCustomValidity(config, args);
    } else if (command == "set-passport-validity") {
        return CommandSetPassportValidity(config, args);
    } else if (command == "revoke") {
        return CommandRevoke(config, args);
    } else if (command == "transfer") {
        return CommandTransfer(config, args);
    } else if (command == "band") {
        return CommandBand(config, args);
    } else if (command == "status") {
        return CommandStatus(config, args);
    } else if (command == "metadata") {
        return CommandMetadata(config, args);
    } else if (command == "nullifier") {
        return CommandNullifier(config, args);
    } else if (command == "passport") {
        return CommandPassport(config, args);
    } else if (command == "commit") {
        return CommandCommit(args);
    } else if (command == "keygen") {
        return CommandKeygen();
    } else if (command == "help") {
        PrintUsage();
        return 0;
    }
    
    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'riskvault-cli help' for usage.\n";
    return 1;
}

int main(int argc, char* argv[]) {
    util::ConfigManager& config = util::GetConfig();
    
    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << "\n";
        return 1;
    }
    
    if (config.HasKey("version")) {
        PrintVersion();
        return 0;
    }
    
    if (config.HasKey("help") || config.HasKey("h")) {
        PrintUsage();
        return 0;
    }
    
    const std::vector<std::string>& args = config.GetPositionalArgs();
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    
    if (!LoadConfigFile(config)) {
        return 1;
    }
    SetupLogging(config);
    
    try {
        int rc = Dispatch(config, args);
        util::Logger::Instance().Flush();
        return rc;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid configuration: " << e.what() << "\n";
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    util::Logger::Instance().Flush();
    return 1;
}
