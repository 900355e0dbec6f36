#include "kernel/SimulationEngine.h"
#include "kernel/Errors.h"
#include "io/MetricsLog.h"
#include "modules/PatternCensus.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

static void printHelp() {
    std::cerr << "Meme Simulation Commands:\n"
              << "  step N             # advance N generations\n"
              << "  run T log          # run T generations, append metrics every 'log' steps to metrics.csv\n"
              << "  stats              # print aggregate statistics\n"
              << "  metrics            # print the statistics map (name = value)\n"
              << "  cell X Y           # show the pool of agent (X,Y)\n"
              << "  census [N]         # N most common dominant patterns (default 10)\n"
              << "  inject BITS        # insert pattern (e.g. 0101...) at a random cell\n"
              << "  reset              # re-initialize with the startup configuration\n"
              << "  help               # this text\n"
              << "  quit               # exit\n"
              << "\nOptions: --size=N --length=L --pool=K --seed=S --policy=fidelity|utility\n"
              << "         --mu-int=R --mu-ext=R --k=R --alpha=A --beta=B --no-inject --parallel\n"
              << "         --log-level=trace|debug|info|warn|error --log-file=PATH [script]\n"
              << "Environment: MEMESIM_POLICY selects the policy when --policy is absent\n";
}

static void configureLogging(const std::string& level, const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(spdlog::level::info);
    console->set_pattern("%^%l%$: %v");
    sinks.push_back(console);

    if (!logFile.empty()) {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        file->set_pattern("%Y-%m-%d %H:%M:%S - %n - %l - %v");
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>("memesim", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(level));
    spdlog::set_default_logger(logger);

    // file sink takes everything at the requested level; console stays at info and up
    if (!logFile.empty()) {
        sinks.back()->set_level(spdlog::level::from_str(level));
        spdlog::info("Logging initialized. Log file: {}", logFile);
    }
    spdlog::info("Log level: {}", level);
}

static void printStats(const SimulationEngine& engine) {
    const auto& s = engine.statistics();
    const auto& cfg = engine.config();
    std::cout << "\n=== MEME STATISTICS (Generation " << engine.generation() << ") ===\n\n";
    std::cout << std::fixed << std::setprecision(4);

    std::cout << "--- DOMINANT MEMES ---\n";
    std::cout << "Complexity: " << s.avgDominantComplexity << " (±" << s.stdDominantComplexity
              << ") range [" << s.minDominantComplexity << ", " << s.maxDominantComplexity << "]\n";
    std::cout << "Entropy:    " << s.avgDominantEntropy << " (±" << s.stdDominantEntropy
              << ") range [" << s.minDominantEntropy << ", " << s.maxDominantEntropy << "]\n";
    if (cfg.policy == SelectionPolicy::Utility) {
        std::cout << "Utility:    " << s.avgDominantUtility << " (±" << s.stdDominantUtility
                  << ") range [" << s.minDominantUtility << ", " << s.maxDominantUtility << "]\n";
        std::cout << "Score:      " << s.avgDominantScore << " (±" << s.stdDominantScore
                  << ") range [" << s.minDominantScore << ", " << s.maxDominantScore << "]\n";
    }

    std::cout << "\n--- POOLS ---\n";
    std::cout << "Avg complexity: " << s.avgPoolComplexity << "\n";
    std::cout << "Avg utility: " << s.avgPoolUtility << "\n";
    std::cout << "Avg pool size: " << std::setprecision(2) << s.avgPoolSize << " / " << cfg.poolCapacity << "\n";
    std::cout << "Avg meme age: " << s.avgMemeAge << "\n";

    std::cout << "\n--- DIVERSITY ---\n";
    std::cout << "Unique patterns: " << s.uniquePatterns << " / " << s.totalPatterns << "\n";
    std::cout << "Diversity: " << std::setprecision(3) << s.patternDiversity << "\n\n";
    std::cout.flush();
}

static void printCell(const SimulationEngine& engine, std::uint32_t x, std::uint32_t y) {
    const auto& cfg = engine.config();
    const Agent& agent = engine.grid().agentAt(x, y);
    const std::size_t dom = agent.dominantIndex(cfg);
    const auto ps = agent.poolStats(cfg);

    std::cout << "Agent(" << x << ", " << y << ") with " << ps.poolSize << " memes\n";
    for (std::size_t i = 0; i < agent.pool().size(); ++i) {
        std::cout << (i == dom ? "  * " : "    ") << agent.pool()[i].toString() << "\n";
    }
    std::cout << std::fixed << std::setprecision(3)
              << "  avg C=" << ps.avgComplexity << ", avg U=" << ps.avgUtility
              << ", avg S=" << ps.avgScore << ", avg age=" << ps.avgAge << "\n";
    std::cout.flush();
}

static void printCensus(const SimulationEngine& engine, std::size_t topN) {
    auto census = takeCensus(engine.grid(), engine.config(), topN);
    std::cout << "\n=== Dominant Patterns (generation " << engine.generation() << ") ===\n";
    std::cout << "Distinct dominant patterns: " << census.distinctPatterns << "\n";
    std::cout << std::fixed << std::setprecision(1)
              << "Most common share: " << census.dominantShare * 100.0 << "%\n\n";
    for (const auto& group : census.groups) {
        std::cout << "  " << patternToString(group.pattern)
                  << "  cells=" << std::setw(5) << group.count
                  << " (" << std::setprecision(1) << group.share * 100.0 << "%)"
                  << "  C=" << std::setprecision(3) << group.complexity
                  << "  U=" << group.utility << "\n";
    }
    std::cout << "\n";
    std::cout.flush();
}

static bool parseOption(const std::string& arg, const char* name, std::string& value) {
    const std::string prefix = std::string("--") + name + "=";
    if (arg.rfind(prefix, 0) != 0) return false;
    value = arg.substr(prefix.size());
    return true;
}

int main(int argc, char** argv) {
    SimConfig cfg;
    std::string logLevel = "info";
    std::string logFile;

    if (const char* envPolicy = std::getenv("MEMESIM_POLICY")) {
        try {
            cfg.policy = parseSelectionPolicy(envPolicy);
        } catch (const std::exception& e) {
            std::cerr << "Ignoring MEMESIM_POLICY: " << e.what() << "\n";
        }
    }

    const char* scriptArg = nullptr;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string v;
            if (parseOption(arg, "size", v)) {
                cfg.gridSize = static_cast<std::uint32_t>(std::stoul(v));
            } else if (parseOption(arg, "length", v)) {
                cfg.memeLength = static_cast<std::uint32_t>(std::stoul(v));
            } else if (parseOption(arg, "pool", v)) {
                cfg.poolCapacity = static_cast<std::uint32_t>(std::stoul(v));
            } else if (parseOption(arg, "seed", v)) {
                cfg.seed = std::stoull(v);
            } else if (parseOption(arg, "policy", v)) {
                cfg.policy = parseSelectionPolicy(v);
            } else if (parseOption(arg, "mu-int", v)) {
                cfg.muInternal = std::stod(v);
            } else if (parseOption(arg, "mu-ext", v)) {
                cfg.muExternal = std::stod(v);
            } else if (parseOption(arg, "k", v)) {
                cfg.scaleFactor = std::stod(v);
            } else if (parseOption(arg, "alpha", v)) {
                cfg.alpha = std::stod(v);
            } else if (parseOption(arg, "beta", v)) {
                cfg.beta = std::stod(v);
            } else if (parseOption(arg, "log-level", v)) {
                logLevel = v;
            } else if (parseOption(arg, "log-file", v)) {
                logFile = v;
            } else if (arg == "--no-inject") {
                cfg.injectReferencePatterns = false;
            } else if (arg == "--parallel") {
                cfg.rngMode = RngMode::PerCell;
            } else if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if (arg.size() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            } else {
                scriptArg = argv[i];
                break;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << "\n";
        return 1;
    }

    // Reference patterns are 4x4 images; other lengths run without them
    if (cfg.memeLength != 16) {
        cfg.referencePatterns.clear();
    }

    try {
        configureLogging(logLevel, logFile);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Log setup failed: " << e.what() << "\n";
        return 1;
    }

    spdlog::info("Grid Size: {}x{}", cfg.gridSize, cfg.gridSize);
    spdlog::info("Meme Length: {}", cfg.memeLength);
    spdlog::info("Pool Size: {}", cfg.poolCapacity);
    spdlog::info("Internal Mutation Rate: {}", cfg.muInternal);
    spdlog::info("External Mutation Rate: {}", cfg.muExternal);
    spdlog::info("Scale Factor: {}", cfg.scaleFactor);

    std::unique_ptr<SimulationEngine> engine;
    try {
        engine = std::make_unique<SimulationEngine>(cfg);
    } catch (const std::exception& e) {
        spdlog::error("Configuration rejected: {}", e.what());
        return 1;
    }

    std::istream* input = &std::cin;
    std::ifstream scriptFile;
    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        spdlog::info("Running commands from script file: {}", scriptArg);
    } else {
        printHelp();
    }

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) continue;
        spdlog::debug("Command: '{}'", cmd);

        try {
            if (cmd == "step") {
                int n = 1;
                iss >> n;
                if (n < 1) n = 1;
                engine->stepN(n);
                std::cout << "Generation " << engine->generation() << "\n";
                std::cout.flush();

            } else if (cmd == "run") {
                int ticks = 100;
                int logFreq = 10;
                iss >> ticks >> logFreq;
                if (logFreq < 1) logFreq = 1;

                bool isNewFile = !std::filesystem::exists("metrics.csv");
                std::ofstream metricsFile("metrics.csv", std::ios::app);
                if (!metricsFile) {
                    spdlog::error("Could not open metrics.csv for writing");
                    continue;
                }
                if (isNewFile) {
                    writeMetricsHeader(engine->config().policy, metricsFile);
                }
                for (int t = 0; t < ticks; ++t) {
                    engine->step();
                    if (t % logFreq == 0 || t == ticks - 1) {
                        logMetrics(*engine, metricsFile);
                    }
                }
                std::cout << "Completed " << ticks << " generations. Metrics written to metrics.csv\n";
                std::cout.flush();

            } else if (cmd == "stats") {
                printStats(*engine);

            } else if (cmd == "metrics") {
                std::cout << "Generation: " << engine->generation() << "\n";
                for (const auto& [name, value] : engine->statisticsMap()) {
                    std::cout << name << " = " << value << "\n";
                }
                std::cout.flush();

            } else if (cmd == "cell") {
                std::uint32_t x = 0, y = 0;
                if (!(iss >> x >> y)) {
                    std::cerr << "Usage: cell X Y\n";
                    continue;
                }
                printCell(*engine, x, y);

            } else if (cmd == "census") {
                std::size_t topN = 10;
                iss >> topN;
                printCensus(*engine, topN);

            } else if (cmd == "inject") {
                std::string bits;
                iss >> bits;
                engine->injectPattern(parsePattern(bits));
                std::cout << "Injected " << bits << "\n";

            } else if (cmd == "reset") {
                engine->reset(cfg);
                std::cout << "Reset: " << cfg.gridSize << "x" << cfg.gridSize << " grid, seed " << cfg.seed << "\n";

            } else if (cmd == "help") {
                printHelp();

            } else if (cmd == "quit" || cmd == "exit") {
                break;

            } else {
                std::cerr << "Unknown command: " << cmd << " (try 'help')\n";
            }
        } catch (const InvalidPatternError& e) {
            std::cerr << "Invalid pattern: " << e.what() << "\n";
        } catch (const std::out_of_range& e) {
            std::cerr << "Out of range: " << e.what() << "\n";
        }
    }

    const auto& s = engine->statistics();
    spdlog::info("SIMULATION COMPLETE");
    spdlog::info("Final Generation: {}", engine->generation());
    spdlog::info("Final diversity: {:.3f} ({} unique of {})", s.patternDiversity, s.uniquePatterns, s.totalPatterns);
    return 0;
}
