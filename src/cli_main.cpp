#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "content.h"
#include "content_loader.h"
#include "decision_policy.h"
#include "drift.h"
#include "ending.h"
#include "simulation_context.h"
#include "simulation_runner.h"
#include "simulation_session.h"

namespace {

struct RunOptions {
    std::uint64_t seed = 1;
    std::string configPath = "data/sim_config.toml";
    std::string contentDir = "data";
    std::string policy = "first"; // first | wait | random | interactive
    int maxTurns = -1;            // -1 means "turns needed to reach endTick"
    std::string outDir;
    bool determinismCheck = false;
};

bool parseUInt64(const std::string& s, std::uint64_t& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoull(s, &pos);
        if (pos != s.size()) return false;
        out = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseBool01(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "TRUE") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "FALSE") {
        out = false;
        return true;
    }
    return false;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "aquasim_cli")
              << " [--seed N] [--config path] [--content dir]\n"
              << "       [--policy first|wait|random|interactive] [--maxTurns N]\n"
              << "       [--outDir path] [--determinismCheck 0|1]\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--seed") {
            std::string v;
            if (!requireValue(v) || !parseUInt64(v, opt.seed)) return false;
        } else if (arg.rfind("--seed=", 0) == 0) {
            if (!parseUInt64(arg.substr(7), opt.seed)) return false;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--content") {
            if (!requireValue(opt.contentDir)) return false;
        } else if (arg.rfind("--content=", 0) == 0) {
            opt.contentDir = arg.substr(10);
        } else if (arg == "--policy") {
            if (!requireValue(opt.policy)) return false;
        } else if (arg.rfind("--policy=", 0) == 0) {
            opt.policy = arg.substr(9);
        } else if (arg == "--maxTurns") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.maxTurns)) return false;
        } else if (arg.rfind("--maxTurns=", 0) == 0) {
            if (!parseInt(arg.substr(11), opt.maxTurns)) return false;
        } else if (arg == "--outDir") {
            if (!requireValue(opt.outDir)) return false;
        } else if (arg.rfind("--outDir=", 0) == 0) {
            opt.outDir = arg.substr(9);
        } else if (arg == "--determinismCheck") {
            std::string v;
            if (!requireValue(v) || !parseBool01(v, opt.determinismCheck)) return false;
        } else if (arg.rfind("--determinismCheck=", 0) == 0) {
            if (!parseBool01(arg.substr(19), opt.determinismCheck)) return false;
        } else {
            std::cerr << "Unknown flag: " << arg << "\n";
            return false;
        }
    }
    if (opt.policy != "first" && opt.policy != "wait" && opt.policy != "random" && opt.policy != "interactive") {
        std::cerr << "Unknown policy: " << opt.policy << "\n";
        return false;
    }
    if (opt.policy == "interactive" && opt.determinismCheck) {
        std::cerr << "--determinismCheck cannot replay an interactive run.\n";
        return false;
    }
    return true;
}

std::string jsonEscape(const std::string& input) {
    std::string out;
    out.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string csvEscape(const std::string& input) {
    bool needsQuotes = false;
    for (char c : input) {
        if (c == '"' || c == ',' || c == '\n' || c == '\r') {
            needsQuotes = true;
            break;
        }
    }
    if (!needsQuotes) {
        return input;
    }
    std::string out;
    out.reserve(input.size() + 2);
    out.push_back('"');
    for (char c : input) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('"');
    return out;
}

// Runner and ending checks prefix broken invariants this way.
bool isInvariantFailure(const std::string& message) {
    return message.rfind("invariant broken", 0) == 0;
}

std::string signedDelta(const std::optional<int>& v) {
    std::ostringstream oss;
    oss << std::showpos << v.value_or(0);
    return oss.str();
}

// Decree report flavour, keyed by the authored narrative key.
const char* narrativeLine(NarrativeKey key) {
    switch (key) {
        case NarrativeKey::PlasticBan: return "The ban holds across the floating settlements; the currents near the cities run cleaner.";
        case NarrativeKey::Cleanup: return "Cleanup crews hauled debris from the water, though the source of the waste remains.";
        case NarrativeKey::Interception: return "River barriers catch plastic before it reaches open water, at a steady upkeep cost.";
        case NarrativeKey::Awareness: return "Citizens talk about the tide of waste and change what they buy.";
        case NarrativeKey::ProducerResponsibility: return "Manufacturers now answer for their packaging and redesign it.";
        case NarrativeKey::WasteInfrastructure: return "New collection and processing lines keep waste on land.";
        case NarrativeKey::MaterialsResearch: return "Laboratories test materials that break down in seawater.";
        case NarrativeKey::Treaty: return "Distant cities signed on; production caps are being enforced.";
        case NarrativeKey::CircularEconomy: return "Goods are built to be repaired and returned instead of discarded.";
        case NarrativeKey::FishingIndustry: return "The fleets prosper, and lost gear drifts through the reefs.";
        case NarrativeKey::FishingLimits: return "Quotas thin the catch while the shoals recover.";
        case NarrativeKey::Fiscal: return "The treasury was reshaped; the people feel it in their purses.";
        case NarrativeKey::Restoration: return "Reefs and kelp beds are slowly returning.";
        case NarrativeKey::Protection: return "Sanctuaries closed to nets are filling with life.";
        case NarrativeKey::Greenwash: return "Labels promise what the sea cannot confirm.";
        case NarrativeKey::None: break;
    }
    return "The effects of the decree are still unfolding.";
}

// Reads choices from stdin; any unparsable answer is asked again.
class InteractivePolicy : public DecisionPolicy {
public:
    int chooseEventBranch(const WorldState&, const EventRecord& event) override {
        std::cout << "\nCRISIS: " << event.name << "\n" << event.text << "\n";
        for (std::size_t i = 0; i < event.choices.size(); ++i) {
            std::cout << "  " << static_cast<char>('A' + i) << ". " << event.choices[i].text << "\n";
        }
        while (true) {
            std::cout << "Choose: " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line)) {
                return 0;
            }
            if (line.size() == 1) {
                const int idx = std::toupper(static_cast<unsigned char>(line[0])) - 'A';
                if (idx >= 0 && idx < static_cast<int>(event.choices.size())) {
                    return idx;
                }
            }
            std::cout << "Please pick one of the listed letters.\n";
        }
    }

    int chooseAction(const WorldState&, const std::vector<const ActionRecord*>& offers) override {
        std::cout << "\nDECISIONS:\n";
        for (std::size_t i = 0; i < offers.size(); ++i) {
            const ActionRecord& a = *offers[i];
            std::cout << "  " << (i + 1) << ". " << a.name;
            if (a.cost > 0) {
                std::cout << " (Cost: $" << a.cost << ")";
            } else {
                std::cout << " (Free)";
            }
            std::cout << "\n     " << a.description << "\n";
        }
        std::cout << "  " << (offers.size() + 1) << ". Wait and observe\n";
        while (true) {
            std::cout << "Choose action (1-" << (offers.size() + 1) << "): " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line)) {
                return static_cast<int>(offers.size());
            }
            int n = 0;
            if (parseInt(line, n) && n >= 1 && n <= static_cast<int>(offers.size()) + 1) {
                return n - 1;
            }
            std::cout << "Please enter a listed number.\n";
        }
    }
};

std::unique_ptr<DecisionPolicy> makePolicy(const std::string& name, const SimulationContext& ctx) {
    if (name == "wait") return std::make_unique<WaitPolicy>();
    if (name == "random") return std::make_unique<SeededRandomPolicy>(ctx);
    if (name == "interactive") return std::make_unique<InteractivePolicy>();
    return std::make_unique<FirstOptionPolicy>();
}

void printTurn(const TurnReport& r, const SimulationSession& session) {
    const SimulationConfig& config = session.config();
    const ContentCatalog& catalog = session.catalog();
    const WorldState& s = r.state;

    std::cout << "\n=== Generation " << (r.turnIndex + 1) << ": " << config.generationName(r.turnIndex)
              << " (" << (r.startTick + 1) << "-" << r.endTick << ")\n";

    if (const EventRecord* e = catalog.findEvent(r.eventId)) {
        std::cout << "Event (" << eventKindName(e->kind) << "): " << e->name;
        if (r.eventInteractive) {
            std::cout << " -> " << r.eventChoice;
        }
        std::cout << "\n";
    } else {
        std::cout << "Event: calm waters\n";
    }

    if (const ActionRecord* a = catalog.findAction(r.actionId)) {
        std::cout << "Decree: " << a->name
                  << " [treasury " << signedDelta(a->effects.treasury)
                  << ", pollution " << signedDelta(a->effects.pollution)
                  << ", vitality " << signedDelta(a->effects.vitality)
                  << ", trust " << signedDelta(a->effects.trust)
                  << ", income " << signedDelta(a->effects.incomeBase) << "]\n"
                  << "  " << narrativeLine(a->narrative) << "\n";
    } else {
        std::cout << "Decree: none, the Guardian waited and observed\n";
    }

    std::cout << "tick=" << s.tick
              << " treasury=" << s.treasury
              << " pollution=" << s.pollution
              << " vitality=" << s.vitality
              << " trust=" << s.trust
              << " income=" << projectedIncome(s) << "/" << s.incomeBase
              << " growth=" << projectedGrowthRate(s, config)
              << " (modifier " << std::showpos << std::fixed << std::setprecision(1) << s.growthModifier
              << std::noshowpos << ")"
              << std::defaultfloat << "\n";
}

bool runOnce(const RunOptions& opt,
             bool verbose,
             std::vector<TurnReport>& reports,
             std::unique_ptr<SimulationSession>& sessionOut,
             std::string* errorMessage) {
    SimulationContext ctx(opt.seed, opt.configPath);
    ContentCatalog catalog;
    if (!loadContentCatalog(opt.contentDir, catalog, errorMessage)) {
        return false;
    }
    auto session = std::make_unique<SimulationSession>(std::move(ctx), std::move(catalog));
    std::unique_ptr<DecisionPolicy> policy = makePolicy(opt.policy, session->context());
    const int maxTurns = (opt.maxTurns >= 0) ? opt.maxTurns : plannedTurns(session->config());

    bool ok = true;
    while (static_cast<int>(reports.size()) < maxTurns) {
        const Ending ending = session->checkEnding();
        if (!validateEnding(ending, errorMessage)) {
            ok = false;
            break;
        }
        if (isTerminal(ending)) {
            break;
        }
        TurnReport report;
        if (!runTurn(*session, *policy, report, errorMessage)) {
            ok = false;
            break;
        }
        if (verbose) {
            printTurn(report, *session);
        }
        reports.push_back(std::move(report));
    }
    sessionOut = std::move(session);
    return ok;
}

const char* actionNarrative(const ContentCatalog& catalog, const std::string& actionId) {
    const ActionRecord* a = catalog.findAction(actionId);
    return a ? narrativeKeyName(a->narrative) : "";
}

bool writeOutputs(const RunOptions& opt,
                  const SimulationSession& session,
                  const std::vector<TurnReport>& reports) {
    std::filesystem::create_directories(opt.outDir);
    const std::filesystem::path csvPath = std::filesystem::path(opt.outDir) / "turns.csv";
    const std::filesystem::path metaPath = std::filesystem::path(opt.outDir) / "run_meta.json";

    std::ofstream csv(csvPath);
    if (!csv) {
        std::cerr << "Could not open " << csvPath.string() << "\n";
        return false;
    }
    csv << "turn,start_tick,end_tick,event_id,event_choice,action_id,action_narrative,offered_actions,"
           "treasury,pollution,vitality,trust,income_base,growth_modifier,ending,state_hash\n";
    csv << std::fixed << std::setprecision(6);
    for (const TurnReport& r : reports) {
        std::string offered;
        for (std::size_t i = 0; i < r.offeredActionIds.size(); ++i) {
            if (i) offered += ';';
            offered += r.offeredActionIds[i];
        }
        csv << r.turnIndex << ','
            << r.startTick << ','
            << r.endTick << ','
            << csvEscape(r.eventId) << ','
            << csvEscape(r.eventChoice) << ','
            << csvEscape(r.actionId) << ','
            << actionNarrative(session.catalog(), r.actionId) << ','
            << csvEscape(offered) << ','
            << r.state.treasury << ','
            << r.state.pollution << ','
            << r.state.vitality << ','
            << r.state.trust << ','
            << r.state.incomeBase << ','
            << r.state.growthModifier << ','
            << endingName(r.ending) << ','
            << r.stateHash << '\n';
    }

    std::ofstream meta(metaPath);
    if (!meta) {
        std::cerr << "Could not open " << metaPath.string() << "\n";
        return false;
    }
    const SimulationContext& ctx = session.context();
    meta << "{\n";
    meta << "  \"seed\": " << opt.seed << ",\n";
    meta << "  \"config_path\": \"" << jsonEscape(ctx.configPath) << "\",\n";
    meta << "  \"config_hash\": \"" << jsonEscape(ctx.configHash) << "\",\n";
    meta << "  \"content_dir\": \"" << jsonEscape(opt.contentDir) << "\",\n";
    meta << "  \"policy\": \"" << jsonEscape(opt.policy) << "\",\n";
    meta << "  \"turns_played\": " << reports.size() << ",\n";
    meta << "  \"final_tick\": " << session.state().tick << ",\n";
    meta << "  \"ending\": \"" << endingName(session.checkEnding()) << "\",\n";
    meta << "  \"final_hash\": " << computeStateHash(session.state()) << "\n";
    meta << "}\n";

    std::cout << "Wrote " << csvPath.string() << ", " << metaPath.string() << "\n";
    return true;
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }
    if (opt.outDir.empty()) {
        std::ostringstream oss;
        oss << "out/cli_runs/seed_" << opt.seed;
        opt.outDir = oss.str();
    }

    std::vector<TurnReport> reports;
    std::unique_ptr<SimulationSession> session;
    std::string runError;
    const bool ok = runOnce(opt, true, reports, session, &runError);
    if (!session) {
        std::cerr << "Error: " << runError << "\n";
        return 1;
    }

    std::cout << "aquasim_cli seed=" << opt.seed
              << " config=" << session->context().configPath
              << " hash=" << session->context().configHash
              << " turns=" << reports.size()
              << " tick=" << session->state().tick
              << " ending=" << endingName(session->checkEnding())
              << "\n";

    if (!ok) {
        std::string invariantError;
        if (!checkStateInvariants(session->state(), &invariantError)) {
            std::cerr << "Invariant failure: " << invariantError << "\n";
            return 3;
        }
        if (isInvariantFailure(runError)) {
            std::cerr << "Invariant failure: " << runError << "\n";
            return 3;
        }
        std::cerr << "Error: " << runError << "\n";
        return 1;
    }
    std::string endingError;
    if (!validateEnding(session->checkEnding(), &endingError)) {
        std::cerr << "Invariant failure: " << endingError << "\n";
        return 3;
    }

    if (!writeOutputs(opt, *session, reports)) {
        return 1;
    }

    if (opt.determinismCheck) {
        std::vector<TurnReport> replay;
        std::unique_ptr<SimulationSession> replaySession;
        std::string replayError;
        if (!runOnce(opt, false, replay, replaySession, &replayError)) {
            std::cerr << "Determinism replay failed: " << replayError << "\n";
            return 3;
        }
        if (replay.size() != reports.size()) {
            std::cerr << "DETERMINISM MISMATCH: replay played " << replay.size()
                      << " turns, first run played " << reports.size() << ".\n";
            return 3;
        }
        for (std::size_t i = 0; i < reports.size(); ++i) {
            if (replay[i].stateHash != reports[i].stateHash) {
                std::cerr << "DETERMINISM MISMATCH at turn " << i
                          << ": " << reports[i].stateHash << " vs " << replay[i].stateHash << "\n";
                return 3;
            }
        }
        std::cout << "Determinism check PASSED for " << reports.size() << " turns.\n";
    }

    switch (session->checkEnding()) {
        case Ending::Collapse:
            std::cout << "\nTHE SILENT DEPTHS: marine life has collapsed.\n";
            break;
        case Ending::ToxicSeas:
            std::cout << "\nTHE POISONED REALM: the ocean is saturated with waste.\n";
            break;
        case Ending::Uprising:
            std::cout << "\nTHE PEOPLE'S REVOLT: the citizens have cast out their Guardian.\n";
            break;
        case Ending::Victory:
            std::cout << "\nTHE ETERNAL GUARDIAN: the seas are clean and full of life.\n";
            break;
        case Ending::Running:
            std::cout << "\nThe configured horizon passed without a decisive outcome.\n";
            break;
    }
    return 0;
}
