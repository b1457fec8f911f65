/**
 * spirits_engine — Headless driver for the spirits world-model core.
 *
 * Reads host state JSON (one tick object, or an array of consecutive ticks),
 * runs each tick through snapshot, economy, scripted intents and the action
 * gateway, and writes a per-tick report with the accepted host commands and
 * every rejected intent.
 *
 * Usage:
 *   spirits_engine --state <path> [--intents <path>] [--config <path>]
 *                  [--output <path>] [--forecast] [--verbose]
 */

#include "game/host_state.hpp"
#include "game/intent.hpp"
#include "game/report_writer.hpp"
#include "game/rules.hpp"
#include "game/tick_driver.hpp"
#include "io/json_reader.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace spirits;

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --state <path> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --state <path>     Host state JSON: one tick object or an array of ticks (required)\n"
              << "  --intents <path>   Intents JSON array to replay through the gateway\n"
              << "  --config <path>    Rules JSON overriding the default game constants\n"
              << "  --output <path>    Output JSON file (default: stdout)\n"
              << "  --forecast         Include the mirrored next-tick structure state\n"
              << "  --verbose          Progress and diagnostics to stderr\n"
              << "  --help             Show this message\n";
}

int main(int argc, char* argv[]) {
    game::CoreConfig config;

    // Parse CLI arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--state" && i + 1 < argc) {
            config.state_path = argv[++i];
        } else if (arg == "--intents" && i + 1 < argc) {
            config.intents_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            config.output_path = argv[++i];
        } else if (arg == "--forecast") {
            config.forecast = true;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config.state_path.empty()) {
        std::cerr << "Error: --state is required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    // Load inputs
    game::RuleSet rules;
    std::vector<game::HostGlobals> ticks;
    std::vector<game::ScheduledIntent> schedule;
    try {
        if (!config.config_path.empty()) {
            rules = game::RulesParser::parse(JsonReader::parse_file(config.config_path));
        }

        JsonValue state = JsonReader::parse_file(config.state_path);
        if (state.is_array()) {
            for (const auto& payload : state.elements()) {
                ticks.push_back(game::HostStateParser::parse(payload, rules));
            }
        } else {
            ticks.push_back(game::HostStateParser::parse(state, rules));
        }

        if (!config.intents_path.empty()) {
            schedule = game::IntentParser::parse_schedule(
                JsonReader::parse_file(config.intents_path));
        }
    } catch (const JsonError& e) {
        std::cerr << "Error parsing input at line " << e.line() << ", column "
                  << e.column() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error loading input: " << e.what() << "\n";
        return 1;
    }

    if (ticks.empty()) {
        std::cerr << "Error: state file has no ticks\n";
        return 1;
    }

    if (config.verbose) {
        std::cerr << "=== Spirits Engine ===\n"
                  << "State: " << config.state_path << " (" << ticks.size() << " ticks)\n"
                  << "Intents: " << schedule.size() << "\n"
                  << "Output: " << (config.output_path.empty() ? "stdout" : config.output_path)
                  << "\n\n";
    }

    auto t_start = std::chrono::high_resolution_clock::now();

    game::ScriptedIntents logic(std::move(schedule));
    game::TickDriver driver(rules, logic, config.forecast, config.verbose);
    std::vector<game::TickResult> results = driver.run(ticks);

    auto t_end = std::chrono::high_resolution_clock::now();
    double elapsed = std::chrono::duration<double>(t_end - t_start).count();

    if (config.output_path.empty()) {
        game::write_report_json(results, std::cout);
    } else {
        std::ofstream out(config.output_path);
        if (!out.is_open()) {
            std::cerr << "Error: cannot open output file: " << config.output_path << "\n";
            return 1;
        }
        game::write_report_json(results, out);
    }

    if (config.verbose) {
        size_t failed = 0;
        for (const auto& r : results) {
            if (!r.error.empty()) failed++;
        }
        std::cerr << "\n" << results.size() << " ticks in " << elapsed << "s ("
                  << failed << " failed, " << driver.diagnostics().size()
                  << " diagnostics)\n";
        if (!config.output_path.empty()) {
            std::cerr << "Written to: " << config.output_path << "\n";
        }
    }

    return 0;
}
