/**
 * @file russell_cli.cpp
 * @brief Run the ground → reason → reflect pipeline over queries
 *
 * Usage: russell_cli [--config <file.json>] [--persist] [--json] [--demo] [query...]
 *
 *   --config   JSON configuration overlaid on defaults (environment wins)
 *   --persist  store reasoning paths in PostgreSQL (PG* environment)
 *   --json     print each reasoning path as one JSON line on stdout
 *   --demo     run the built-in demonstration queries and report requirements
 *
 * Exit status is 2 when any path fails a safety check.
 */

#include <cognitive/cognitive_core.hpp>
#include <config/engine_config.hpp>
#include <database/postgres_connection.hpp>
#include <serialization/record_json.hpp>
#include <storage/postgres_sink.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace Russell;

static const std::vector<std::string> kDemoQueries = {
    "If all men are mortal and Socrates is a man, then Socrates is mortal",
    "The square root of 16 is 4 and also -4",
    "Every effect has a cause, but the universe has no cause",
    "This statement is false"
};

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config <file.json>] [--persist] [--json] [--demo] [query...]\n";
}

static void print_path(const ReasoningPath& path, const EngineMetrics& metrics) {
    std::cout << "\nQuery: " << path.query << "\n";
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "  Grounding:   " << path.grounding_certainty
              << (path.grounding_fallback ? " (fallback)" : "") << "\n";
    std::cout << "  Certainty:   " << path.reasoning.certainty
              << " (depth " << path.reasoning_depth << ")\n";
    std::cout << "  Emergence:   " << std::setprecision(2) << path.emergence << "\n";
    std::cout << "  Lambda:      " << std::setprecision(3) << metrics.lambda_total
              << " (+" << std::setprecision(4) << path.lambda_impact << ")\n";
    std::cout << "  Safety:      " << (path.safety.all_passed() ? "pass" : "FAIL") << "\n";
    std::cout << "  Convergence: " << (path.convergence.converged ? "converged" : "growing")
              << " (confidence " << std::setprecision(2) << path.convergence.confidence << ")\n";
    std::cout << "  Requirements " << std::setprecision(0) << path.requirements.score() * 100.0
              << "%\n";
}

static void print_requirements(const RequirementsReport& report) {
    std::cout << "\nRequirements: " << std::setprecision(1) << report.score() * 100.0 << "%\n";
    if (report.all_met()) {
        std::cout << "  All " << report.checks.size() << " requirements met\n";
        return;
    }
    for (const auto& name : report.unmet()) {
        std::cout << "  unmet: " << name << "\n";
    }
}

int main(int argc, char** argv) {
    std::string config_path;
    bool persist = false;
    bool json_output = false;
    bool demo = false;
    std::vector<std::string> queries;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--persist") {
            persist = true;
        } else if (arg == "--json") {
            json_output = true;
        } else if (arg == "--demo") {
            demo = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            queries.push_back(arg);
        }
    }

    if (demo) queries.insert(queries.end(), kDemoQueries.begin(), kDemoQueries.end());
    if (queries.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        EngineConfig config = config_path.empty()
            ? EngineConfig::load_from_env()
            : EngineConfig::load_from_file(config_path);
        Logger::set_level(config.log_level);

        std::unique_ptr<PostgresConnection> db;
        std::shared_ptr<PostgresSink> sink;
        if (persist || config.persist) {
            db = std::make_unique<PostgresConnection>(config.database);
            if (!db->is_connected()) {
                std::cerr << "Failed to connect to database. Check PG environment variables.\n";
                return 1;
            }
            sink = std::make_shared<PostgresSink>(*db, config.database.schema);
            sink->ensure_schema();
        }

        CognitiveCore core(config, sink);

        Timer timer;
        size_t safety_failures = 0;
        for (const auto& query : queries) {
            ReasoningPath path = core.process(query);
            if (!path.safety.all_passed()) ++safety_failures;

            if (json_output) {
                std::cout << dump_record(path) << "\n";
            } else {
                print_path(path, core.get_metrics());
            }
        }

        EngineMetrics metrics = core.get_metrics();
        if (json_output) {
            std::cout << dump_record(metrics) << "\n";
        } else {
            std::cout << "\nSummary\n";
            std::cout << "  Queries:     " << metrics.queries_processed << "\n";
            std::cout << "  R3 cycles:   " << metrics.cycles_completed << "\n";
            std::cout << std::fixed << std::setprecision(3);
            std::cout << "  Lambda:      " << metrics.lambda_total << "\n";
            std::cout << "  Grounding:   " << metrics.avg_grounding_certainty << "\n";
            std::cout << "  Certainty:   " << metrics.avg_certainty << "\n";
            std::cout << "  Emergence:   " << std::setprecision(2) << metrics.avg_emergence << "\n";
            std::cout << "  Avg depth:   " << metrics.avg_reasoning_depth << "\n";
            std::cout << "  Improvements " << metrics.improvements_applied << " applied, "
                      << metrics.improvements_failed << " failed\n";
            std::cout << "  Duration:    " << std::setprecision(2) << timer.elapsed_sec() << "s\n";
            if (demo) print_requirements(metrics.requirements);
        }

        return safety_failures == 0 ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}
