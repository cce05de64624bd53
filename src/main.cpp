/**
 * @file main.cpp
 * @brief Renju sandbox runner - Command-line interface
 *
 * Subcommands:
 * - `exec`    run a code file through the sandbox broker
 * - `prepare` check the container runtime and the interpreter image
 * - `play`    terminal Gomoku against a sandboxed strategy (or the heuristic)
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "renju/core/code_loader.hpp"
#include "renju/core/sandbox_broker.hpp"
#include "renju/core/sandbox_config.hpp"
#include "renju/game/game_session.hpp"
#include "renju/game/heuristic_player.hpp"
#include "renju/game/move_parser.hpp"
#include "renju/game/strategy_player.hpp"
#include "renju/reporters/json_reporter.hpp"
#include "renju/utils/string_utils.hpp"

#include <iostream>
#include <memory>
#include <optional>

using namespace renju;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║        ██████╗ ███████╗███╗   ██╗     ██╗██╗   ██╗            ║
║        ██╔══██╗██╔════╝████╗  ██║     ██║██║   ██║            ║
║        ██████╔╝█████╗  ██╔██╗ ██║     ██║██║   ██║            ║
║        ██╔══██╗██╔══╝  ██║╚██╗██║██   ██║██║   ██║            ║
║        ██║  ██║███████╗██║ ╚████║╚█████╔╝╚██████╔╝            ║
║        ╚═╝  ╚═╝╚══════╝╚═╝  ╚═══╝ ╚════╝  ╚═════╝             ║
║                                                               ║
║            Sandboxed Strategy Arena for Gomoku                ║
║                              v1.0.0                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

void ConfigureLogging(bool verbose) {
    // Logs go to stderr so stdout carries only program output / JSON
    spdlog::set_default_logger(spdlog::stderr_color_mt("renju"));

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

// Plain source or a .ipynb notebook reduced to its code cells
std::optional<std::string> ReadCode(const std::string& path) {
    auto code = core::LoadCode(path);
    if (!code.ok()) {
        spdlog::error("[ERROR] {}", code.error);
        return std::nullopt;
    }
    return *code.value;
}

std::optional<core::SandboxConfig> LoadConfiguration(const std::string& config_path) {
    if (config_path.empty()) {
        return core::SandboxConfig{};
    }

    auto loaded = core::LoadConfig(config_path);
    if (!loaded.ok()) {
        spdlog::error("[ERROR] {}", loaded.error);
        return std::nullopt;
    }
    return *loaded.value;
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int RunExec(const core::SandboxConfig& config, const std::string& code_path,
            bool json_output, const std::string& report_dir) {
    auto code = ReadCode(code_path);
    if (!code) {
        return 1;
    }

    core::SandboxBroker broker(config);
    auto report = broker.Execute(*code);

    reporters::JsonReporterConfig reporter_config;
    if (!report_dir.empty()) {
        reporter_config.output_directory = report_dir;
    }
    reporters::JsonReporter reporter(reporter_config);

    if (json_output) {
        std::cout << reporter.GenerateJsonString(report) << std::endl;
    } else {
        std::cout << report.output;
        if (!report.output.empty() && report.output.back() != '\n') {
            std::cout << std::endl;
        }
    }

    if (!report_dir.empty() && reporter.GenerateReport(report).empty()) {
        spdlog::warn("[WARN] Failed to generate JSON report");
    }

    return report.Succeeded() ? 0 : 1;
}

int RunPrepare(core::SandboxConfig config, bool pull) {
    if (pull) {
        config.pull_missing_image = true;
    }

    core::SandboxBroker broker(config);
    auto prepared = broker.Prepare();
    if (!prepared.ok()) {
        spdlog::error("[ERROR] {}", prepared.error);
        return 1;
    }

    spdlog::info("[DONE] Sandbox ready ({})", config.image);
    return 0;
}

int RunPlay(const core::SandboxConfig& config, const std::string& strategy_path,
            std::optional<unsigned int> seed) {
    PrintBanner();

    game::HeuristicPlayer heuristic = seed ? game::HeuristicPlayer(*seed)
                                           : game::HeuristicPlayer();
    std::unique_ptr<game::StrategyPlayer> strategy;

    if (!strategy_path.empty()) {
        auto code = ReadCode(strategy_path);
        if (!code) {
            return 1;
        }
        auto broker = std::make_shared<core::SandboxBroker>(config);
        strategy = std::make_unique<game::StrategyPlayer>(broker, *code, heuristic);
        spdlog::info("[INIT] AI strategy loaded from {}", strategy_path);
    } else {
        spdlog::info("[INIT] AI uses the built-in heuristic");
    }

    game::GameSession session;
    std::cout << "You play black (X). Enter moves as 'row col'; 'new' restarts, 'quit' exits.\n\n";
    std::cout << session.GetBoard().ToText() << std::endl;

    std::string line;
    while (std::cout << "> " << std::flush && std::getline(std::cin, line)) {
        std::string input = utils::StringUtils::Trim(line);

        if (input == "quit" || input == "q") {
            break;
        }
        if (input == "new") {
            session.Reset();
            std::cout << session.GetBoard().ToText() << std::endl;
            continue;
        }
        if (session.IsOver()) {
            std::cout << "Game over. Type 'new' or 'quit'.\n";
            continue;
        }

        auto move = game::MoveParser::Parse(input);
        if (!move) {
            std::cout << "Could not read a coordinate from '" << input << "'.\n";
            continue;
        }

        auto played = session.Play(*move);
        if (played != game::PlayResult::ACCEPTED) {
            std::cout << "Move " << game::MoveToString(*move) << " rejected: "
                      << game::PlayResultToString(played) << "\n";
            continue;
        }

        if (!session.IsOver()) {
            game::Move reply;
            if (strategy) {
                auto decision = strategy->ChooseMove(session.GetBoard(), session.CurrentPlayer());
                if (!decision.strategy_output.empty()) {
                    std::cout << "[strategy] " << decision.strategy_output;
                    if (decision.strategy_output.back() != '\n') {
                        std::cout << "\n";
                    }
                }
                if (decision.source == game::MoveSource::FALLBACK) {
                    std::cout << "[fallback] " << decision.fallback_reason << "\n";
                }
                reply = decision.move;
            } else {
                reply = heuristic.ChooseMove(session.GetBoard(), session.CurrentPlayer());
            }

            auto ai_played = session.Play(reply);
            if (ai_played != game::PlayResult::ACCEPTED) {
                spdlog::error("[ERROR] AI move {} rejected: {}", game::MoveToString(reply),
                              game::PlayResultToString(ai_played));
                return 1;
            }
            std::cout << "AI plays " << game::MoveToString(reply) << "\n";
        }

        std::cout << "\n" << session.GetBoard().ToText() << std::endl;

        if (session.IsOver()) {
            if (session.IsDraw()) {
                std::cout << "Draw: the board is full.\n";
            } else {
                std::cout << (*session.Winner() == game::Stone::BLACK ? "You win!" : "AI wins!")
                          << "\n";
            }
        }
    }

    return 0;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Renju sandboxed strategy runner"};
    app.require_subcommand(1);
    app.fallthrough();

    std::string config_path;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON sandbox configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // exec
    auto* exec_cmd = app.add_subcommand("exec", "Run a code file in the sandbox");
    std::string code_path;
    int timeout_seconds = 0;
    std::size_t memory_mb = 0;
    bool json_output = false;
    std::string report_dir;

    exec_cmd->add_option("file", code_path, "Code file (.py or .ipynb) to execute")
        ->required()
        ->check(CLI::ExistingFile);
    exec_cmd->add_option("--timeout", timeout_seconds, "Time limit in seconds")
        ->check(CLI::PositiveNumber);
    exec_cmd->add_option("--memory", memory_mb, "Memory limit in MB")
        ->check(CLI::PositiveNumber);
    exec_cmd->add_flag("--json", json_output, "Print the JSON report instead of the output");
    exec_cmd->add_option("--report-dir", report_dir, "Also save the JSON report here");

    // prepare
    auto* prepare_cmd = app.add_subcommand("prepare", "Check the runtime and the image");
    bool pull = false;
    prepare_cmd->add_flag("--pull", pull, "Pull the image when it is missing");

    // play
    auto* play_cmd = app.add_subcommand("play", "Play Gomoku against a strategy");
    std::string strategy_path;
    unsigned int seed_value = 0;
    play_cmd->add_option("--strategy", strategy_path, "Python strategy (.py or .ipynb) defining next_move")
        ->check(CLI::ExistingFile);
    auto* seed_opt = play_cmd->add_option("--seed", seed_value, "Seed for the heuristic player");

    CLI11_PARSE(app, argc, argv);

    ConfigureLogging(verbose);

    try {
        auto config = LoadConfiguration(config_path);
        if (!config) {
            return 1;
        }

        if (*exec_cmd) {
            if (timeout_seconds > 0) {
                config->limits.time_limit = std::chrono::seconds(timeout_seconds);
            }
            if (memory_mb > 0) {
                config->limits.memory_limit_mb = memory_mb;
            }
            return RunExec(*config, code_path, json_output, report_dir);
        }
        if (*prepare_cmd) {
            return RunPrepare(*config, pull);
        }
        if (*play_cmd) {
            std::optional<unsigned int> seed;
            if (seed_opt->count() > 0) {
                seed = seed_value;
            }
            return RunPlay(*config, strategy_path, seed);
        }

        return 1;

    } catch (const std::invalid_argument& e) {
        spdlog::error("[ERROR] {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
