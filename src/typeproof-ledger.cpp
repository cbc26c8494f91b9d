// TypeProof - Ledger Tool
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Runs leaderboard contract calls against a LevelDB ledger directory.
// The -signer address is the one authorized address of each invocation.
//
//   typeproof-ledger [options] <command> [args...]

#include "typeproof/core/hex.h"
#include "typeproof/core/types.h"
#include "typeproof/ledger/entries.h"
#include "typeproof/ledger/errors.h"
#include "typeproof/ledger/host.h"
#include "typeproof/ledger/leaderboard.h"
#include "typeproof/ledger/leveldb_store.h"
#include "typeproof/proof/issuer.h"
#include "typeproof/proof/prompt.h"
#include "typeproof/proof/prover.h"
#include "typeproof/proof/replay.h"
#include "typeproof/proof/verifier.h"
#include "typeproof/util/config.h"
#include "typeproof/util/logging.h"

#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace typeproof {

namespace {

constexpr const char* DEFAULT_DATADIR = "typeproof-ledger";

void PrintHelp() {
    std::cout << "TypeProof ledger tool\n\n";
    std::cout << "Usage: typeproof-ledger [options] <command> [args...]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  init <admin_hex> [verifier_hex] [image_hex]\n";
    std::cout << "                             Initialize the ledger (defaults: seal verifier,\n";
    std::cout << "                             replay program)\n";
    std::cout << "  set-challenge <id> <prompt>\n";
    std::cout << "                             Record a challenge prompt (signer must be admin)\n";
    std::cout << "  set-current <id>           Mark a challenge current (signer must be admin)\n";
    std::cout << "  current                    Show the current challenge\n";
    std::cout << "  submit <name> <challenge> <prompt> <events_hex>\n";
    std::cout << "                             Prove a run for the signer and submit it\n";
    std::cout << "  best <challenge> <player_hex>\n";
    std::cout << "                             Show a player's best entry\n";
    std::cout << "  top <challenge>            Show the ranked top table\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -conf=FILE                 Read options from FILE\n";
    std::cout << "  -datadir=DIR               Ledger directory (default: " << DEFAULT_DATADIR << ")\n";
    std::cout << "  -signer=HEX                Address authorized for this call\n";
    std::cout << "  -sequence=N                Ledger sequence recorded with scores (default: 0)\n";
    std::cout << "  -verifier=seal|accept      Proof verifier (default: seal)\n";
    std::cout << "  -receiptkind=KIND          Receipt kind for submit (default: groth16)\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error (default: info)\n";
    std::cout << "  -logfile=FILE              Also log to FILE\n";
    std::cout << "  -printtoconsole=0/1        Log to the console (default: 1)\n";
}

bool LoadConfig(int argc, char* argv[], util::ConfigManager& config) {
    util::ConfigParseResult result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }

    auto confPath = config.TryGetString(util::ConfigKeys::CONF);
    if (confPath) {
        result = config.ParseFile(*confPath);
        if (!result.success) {
            std::cerr << "Error: " << result.ToString() << "\n";
            return false;
        }
        config.ParseCommandLine(argc, argv);
    }
    return true;
}

void SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, "info"));
    logger.SetLevel(level);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useStderr = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    auto logFile = config.TryGetString(util::ConfigKeys::LOGFILE);
    if (logFile) {
        util::FileSink::Config fileConfig;
        fileConfig.path = *logFile;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: cannot open log file " << *logFile << "\n";
        }
    }
}

// ============================================================================
// Argument Parsing
// ============================================================================

bool ParseChallengeId(const std::string& str, ChallengeId& out) {
    size_t pos = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(str, &pos, 10);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != str.size() || str[0] == '-' ||
        value > std::numeric_limits<ChallengeId>::max()) {
        std::cerr << "Error: invalid challenge id: " << str << "\n";
        return false;
    }
    out = static_cast<ChallengeId>(value);
    return true;
}

template<size_t N>
bool ParseBlob(const std::string& str, const char* what, FixedBlob<N>& out) {
    if (!FixedBlob<N>::FromHex(str, out)) {
        std::cerr << "Error: expected " << N << "-byte hex " << what << "\n";
        return false;
    }
    return true;
}

bool CheckArgs(const std::vector<std::string>& args, size_t min, size_t max) {
    size_t given = args.size() - 1;
    if (given < min || given > max) {
        std::cerr << "Error: wrong number of arguments for " << args[0]
                  << " (see -help)\n";
        return false;
    }
    return true;
}

int Report(ledger::LedgerError err) {
    if (err != ledger::LedgerError::OK) {
        std::cerr << "Error: " << ledger::LedgerErrorToString(err) << "\n";
        return 1;
    }
    return 0;
}

void PrintEntry(const ledger::ScoreEntry& entry) {
    std::cout << "name: " << entry.name << "\n";
    std::cout << "score: " << entry.score << "\n";
    std::cout << "wpm_x100: " << entry.wpmX100 << "\n";
    std::cout << "accuracy_bps: " << entry.accuracyBps << "\n";
    std::cout << "duration_ms: " << entry.durationMs << "\n";
    std::cout << "submitted_ledger: " << entry.submittedLedger << "\n";
}

// ============================================================================
// Commands
// ============================================================================

class LedgerTool {
public:
    LedgerTool(const util::ConfigManager& config, ledger::LedgerStore& store,
               const proof::IProofVerifier& verifier)
        : config_(config),
          ledgerInfo_(static_cast<LedgerSeq>(
              config.GetUInt(util::ConfigKeys::SEQUENCE, 0))),
          contract_(store, auth_, ledgerInfo_, verifier) {}

    bool AuthorizeSigner() {
        auto signerHex = config_.TryGetString(util::ConfigKeys::SIGNER);
        if (!signerHex) {
            return true;
        }
        if (!ParseBlob(*signerHex, "signer address", signer_)) {
            return false;
        }
        hasSigner_ = true;
        auth_.Authorize(signer_);
        return true;
    }

    int Run(const std::vector<std::string>& args) {
        const std::string& cmd = args[0];
        if (cmd == "init") return Init(args);
        if (cmd == "set-challenge") return SetChallenge(args);
        if (cmd == "set-current") return SetCurrent(args);
        if (cmd == "current") return Current(args);
        if (cmd == "submit") return Submit(args);
        if (cmd == "best") return Best(args);
        if (cmd == "top") return Top(args);
        std::cerr << "Error: unknown command: " << cmd << "\n";
        return 1;
    }

private:
    int Init(const std::vector<std::string>& args) {
        if (!CheckArgs(args, 1, 3)) return 1;

        ledger::Address admin;
        Hash256 verifierId = proof::SealVerifier::DefaultId();
        ImageId imageId = proof::ReplayProgramId();
        if (!ParseBlob(args[1], "admin address", admin)) return 1;
        if (args.size() > 2 && !ParseBlob(args[2], "verifier id", verifierId)) return 1;
        if (args.size() > 3 && !ParseBlob(args[3], "image id", imageId)) return 1;

        return Report(contract_.Init(admin, verifierId, imageId));
    }

    int SetChallenge(const std::vector<std::string>& args) {
        if (!CheckArgs(args, 2, 2)) return 1;

        ChallengeId id = 0;
        if (!ParseChallengeId(args[1], id)) return 1;
        Hash256 promptHash;
        proof::ProofError perr = proof::HashRawPrompt(args[2], promptHash);
        if (perr != proof::ProofError::OK) {
            std::cerr << "Error: " << proof::ProofErrorToString(perr) << "\n";
            return 1;
        }

        int rc = Report(contract_.SetChallenge(id, promptHash));
        if (rc == 0) {
            std::cout << "prompt_hash: " << promptHash.ToHex() << "\n";
        }
        return rc;
    }

    int SetCurrent(const std::vector<std::string>& args) {
        if (!CheckArgs(args, 1, 1)) return 1;

        ChallengeId id = 0;
        if (!ParseChallengeId(args[1], id)) return 1;
        return Report(contract_.SetCurrentChallenge(id));
    }

    int Current(const std::vector<std::string>& args) {
        if (!CheckArgs(args, 0, 0)) return 1;

        ChallengeId id = 0;
        Hash256 promptHash;
        int rc = Report(contract_.GetCurrentChallenge(id, promptHash));
        if (rc == 0) {
            std::cout << "challenge_id: " << id << "\n";
            std::cout << "prompt_hash: " << promptHash.ToHex() << "\n";
        }
        return rc;
    }

    int Submit(const std::vector<std::string>& args) {
        if (!CheckArgs(args, 4, 4)) return 1;
        if (!hasSigner_) {
            std::cerr << "Error: submit requires -signer\n";
            return 1;
        }

        const std::string& name = args[1];
        ChallengeId id = 0;
        if (!ParseChallengeId(args[2], id)) return 1;
        Bytes eventBytes;
        try {
            eventBytes = HexToBytes(args[4]);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: invalid events hex: " << e.what() << "\n";
            return 1;
        }

        proof::LocalProver prover;
        proof::ProofIssuer issuer(prover, proof::IssuerOptions::FromConfig(config_));
        proof::ProveOutcome outcome = issuer.Prove(id, signer_, args[3], eventBytes);
        if (!outcome.IsValid()) {
            std::cerr << "Error: " << proof::ProveStatusToString(outcome.status) << ": "
                      << outcome.message << "\n";
            return 1;
        }

        const proof::ProveResult& result = outcome.result;
        auto sub = ledger::ScoreSubmission::FromJournal(result.journal, name,
                                                        result.journalHash,
                                                        result.imageId, result.seal);
        bool improved = false;
        int rc = Report(contract_.SubmitScore(sub, &improved));
        if (rc == 0) {
            std::cout << "score: " << result.journal.score << "\n";
            std::cout << "improved: " << (improved ? "yes" : "no") << "\n";
        }
        return rc;
    }

    int Best(const std::vector<std::string>& args) {
        if (!CheckArgs(args, 2, 2)) return 1;

        ChallengeId id = 0;
        ledger::Address player;
        if (!ParseChallengeId(args[1], id)) return 1;
        if (!ParseBlob(args[2], "player address", player)) return 1;

        std::optional<ledger::ScoreEntry> entry;
        int rc = Report(contract_.GetBest(id, player, entry));
        if (rc != 0) return rc;
        if (!entry) {
            std::cout << "no score\n";
            return 0;
        }
        PrintEntry(*entry);
        return 0;
    }

    int Top(const std::vector<std::string>& args) {
        if (!CheckArgs(args, 1, 1)) return 1;

        ChallengeId id = 0;
        if (!ParseChallengeId(args[1], id)) return 1;

        std::vector<ledger::LeaderboardRow> rows;
        int rc = Report(contract_.GetTop(id, rows));
        if (rc != 0) return rc;
        for (size_t i = 0; i < rows.size(); ++i) {
            const auto& row = rows[i];
            std::cout << (i + 1) << ". " << row.name << " " << row.score
                      << " wpm_x100=" << row.wpmX100
                      << " accuracy_bps=" << row.accuracyBps
                      << " player=" << row.player.ToHex() << "\n";
        }
        return 0;
    }

    const util::ConfigManager& config_;
    ledger::SessionAuthorizer auth_;
    ledger::ManualLedgerInfo ledgerInfo_;
    ledger::LeaderboardContract contract_;
    ledger::Address signer_;
    bool hasSigner_{false};
};

} // namespace

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    if (!LoadConfig(argc, argv, config)) {
        return 1;
    }
    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }

    const auto& args = config.GetPositional();
    if (args.empty()) {
        std::cerr << "Error: no command given (see -help)\n";
        return 1;
    }
    SetupLogging(config);

    std::unique_ptr<proof::IProofVerifier> verifier;
    std::string verifierName = config.GetString(util::ConfigKeys::VERIFIER, "seal");
    if (verifierName == "seal") {
        verifier = std::make_unique<proof::SealVerifier>();
    } else if (verifierName == "accept") {
        verifier = std::make_unique<proof::AcceptAllVerifier>();
    } else {
        std::cerr << "Error: unknown verifier: " << verifierName << "\n";
        return 1;
    }

    std::string datadir = config.GetString(util::ConfigKeys::DATADIR, DEFAULT_DATADIR);
    auto [status, store] = ledger::LevelDBLedgerStore::Open(datadir);
    if (!status.ok()) {
        std::cerr << "Error: cannot open ledger at " << datadir << ": "
                  << status.ToString() << "\n";
        return 1;
    }

    LedgerTool tool(config, *store, *verifier);
    if (!tool.AuthorizeSigner()) {
        return 1;
    }
    int rc = tool.Run(args);
    util::Logger::Instance().Shutdown();
    return rc;
}

} // namespace typeproof

int main(int argc, char* argv[]) {
    try {
        return typeproof::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
