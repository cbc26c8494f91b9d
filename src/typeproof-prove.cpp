// TypeProof - Proof Issuance Tool
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Proves a typing run and prints the proof artifact and journal fields.
//
//   typeproof-prove [options]                        built-in fixture
//   typeproof-prove [options] <challenge_id> <player_pubkey_hex> <prompt> <events_hex>

#include "typeproof/core/hex.h"
#include "typeproof/core/types.h"
#include "typeproof/proof/events.h"
#include "typeproof/proof/issuer.h"
#include "typeproof/proof/prompt.h"
#include "typeproof/proof/prover.h"
#include "typeproof/proof/replay.h"
#include "typeproof/util/config.h"
#include "typeproof/util/logging.h"

#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

namespace typeproof {

namespace {

// ============================================================================
// Fixture
// ============================================================================

constexpr ChallengeId FIXTURE_CHALLENGE = 1;
constexpr Byte FIXTURE_PLAYER_BYTE = 7;
constexpr const char* FIXTURE_PROMPT = "hello world";
constexpr uint16_t FIXTURE_DELAY_MS = 120;

struct ProveRequest {
    ChallengeId challengeId{0};
    PlayerKey player;
    std::string prompt;
    Bytes eventBytes;
};

bool MakeFixture(ProveRequest& req) {
    req.challengeId = FIXTURE_CHALLENGE;
    req.player = PlayerKey::Filled(FIXTURE_PLAYER_BYTE);
    req.prompt = FIXTURE_PROMPT;

    Bytes normalized;
    if (proof::NormalizePrompt(req.prompt, normalized) != proof::ProofError::OK) {
        return false;
    }
    auto events = proof::EventsForText(normalized, FIXTURE_DELAY_MS);
    return proof::EncodeEvents(events, req.eventBytes) == proof::ProofError::OK;
}

// ============================================================================
// Command Line
// ============================================================================

void PrintHelp() {
    std::cout << "TypeProof proof issuance\n\n";
    std::cout << "Usage: typeproof-prove [options] [<challenge_id> <player_pubkey_hex> <prompt> <events_hex>]\n\n";
    std::cout << "Without positional arguments a built-in fixture is proved.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -conf=FILE                 Read options from FILE\n";
    std::cout << "  -printimageid              Print the replay program identity and exit\n";
    std::cout << "  -receiptkind=KIND          composite, succinct or groth16 (default: groth16)\n";
    std::cout << "                             " << util::RECEIPT_KIND_ENV << " overrides this\n";
    std::cout << "  -maxevents=N               Event cap (default: " << proof::DEFAULT_MAX_EVENTS << ")\n";
    std::cout << "  -maxpromptchars=N          Prompt cap (default: " << proof::DEFAULT_MAX_PROMPT_CHARS << ")\n";
    std::cout << "  -segmentevents=N           Events per composite segment (default: "
              << proof::DEFAULT_SEGMENT_EVENTS << ")\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error (default: warn)\n";
    std::cout << "  -logfile=FILE              Also log to FILE\n";
    std::cout << "  -printtoconsole=0/1        Log to the console (default: 1)\n";
}

bool LoadConfig(int argc, char* argv[], util::ConfigManager& config) {
    util::ConfigParseResult result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }

    // Command line takes precedence over the file
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
        config.GetString(util::ConfigKeys::LOGLEVEL, "warn"));
    logger.SetLevel(level);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useStderr = true;
        consoleConfig.useColors = false;
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

bool ParseRequest(const std::vector<std::string>& args, ProveRequest& req) {
    size_t pos = 0;
    unsigned long id = 0;
    try {
        id = std::stoul(args[0], &pos, 10);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != args[0].size() || args[0][0] == '-' ||
        id > std::numeric_limits<ChallengeId>::max()) {
        std::cerr << "Error: invalid challenge id: " << args[0] << "\n";
        return false;
    }
    req.challengeId = static_cast<ChallengeId>(id);

    if (!PlayerKey::FromHex(args[1], req.player)) {
        std::cerr << "Error: expected 32-byte hex player key\n";
        return false;
    }

    req.prompt = args[2];

    try {
        req.eventBytes = HexToBytes(args[3]);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: invalid events hex: " << e.what() << "\n";
        return false;
    }
    return true;
}

void PrintResult(const proof::ProveResult& result) {
    const proof::Journal& j = result.journal;
    std::cout << "image_id: " << result.imageId.ToHex() << "\n";
    std::cout << "seal: " << BytesToHex(result.seal) << "\n";
    std::cout << "journal_sha256: " << result.journalHash.ToHex() << "\n";
    std::cout << "journal.challenge_id: " << j.challengeId << "\n";
    std::cout << "journal.player_pubkey: " << j.playerKey.ToHex() << "\n";
    std::cout << "journal.prompt_hash: " << j.promptHash.ToHex() << "\n";
    std::cout << "journal.score: " << j.score << "\n";
    std::cout << "journal.wpm_x100: " << j.wpmX100 << "\n";
    std::cout << "journal.accuracy_bps: " << j.accuracyBps << "\n";
    std::cout << "journal.duration_ms: " << j.durationMs << "\n";
}

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
    SetupLogging(config);

    if (config.GetBool(util::ConfigKeys::PRINTIMAGEID, false)) {
        std::cout << "image_id: " << proof::ReplayProgramId().ToHex() << "\n";
        return 0;
    }

    ProveRequest req;
    const auto& args = config.GetPositional();
    if (args.empty()) {
        if (!MakeFixture(req)) {
            std::cerr << "Error: cannot build fixture\n";
            return 1;
        }
    } else if (args.size() == 4) {
        if (!ParseRequest(args, req)) {
            return 1;
        }
    } else {
        std::cerr << "usage: typeproof-prove <challenge_id> <player_pubkey_hex> <prompt> <events_hex>\n";
        return 1;
    }

    proof::LocalProver prover;
    proof::ProofIssuer issuer(prover, proof::IssuerOptions::FromConfig(config));
    proof::ProveOutcome outcome = issuer.Prove(req.challengeId, req.player, req.prompt,
                                               req.eventBytes);
    if (!outcome.IsValid()) {
        std::cerr << "Error: " << proof::ProveStatusToString(outcome.status) << ": "
                  << outcome.message << "\n";
        util::Logger::Instance().Shutdown();
        return 1;
    }

    PrintResult(outcome.result);
    util::Logger::Instance().Shutdown();
    return 0;
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
