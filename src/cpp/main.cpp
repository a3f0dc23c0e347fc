// =============================================================================
// docbench -- document-database latency overhead decomposition
//
// Runs a configurable read/update/delete workload against one adapter and
// splits every operation's latency into serialization, wire, server and
// deserialization components. Warm-up samples are discarded; the measured
// phase is summarized as latency histograms (p50/p95/p99/p999).
//
// Adapters: postgres (libpq, json/jsonb documents), memory (in-process store
// with a session thread per connection; no external dependency).
// =============================================================================

#include <cstdio>
#include <cstring>
#include <exception>
#include <string>

#include "config.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "experiment/benchmark_runner.hpp"
#include "experiment/results_exporter.hpp"

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  --config PATH       JSON config file (default: built-in defaults)\n"
        "  --adapter ID        Adapter to benchmark: postgres, memory\n"
        "  --uri URI           Connection URI (postgresql://user:pw@host:5432/db)\n"
        "  --iterations N      Measured iterations (default: 1000)\n"
        "  --warmup N          Warm-up iterations, discarded (default: 100)\n"
        "  --threads N         Worker threads, one connection each (default: 1)\n"
        "  --documents N       Documents seeded before the run (default: 100)\n"
        "  --seed N            Workload PRNG seed (default: 42)\n"
        "  --format FMT        Summary on stdout: text, json (default: text)\n"
        "  --results PATH      Also write the JSON report to PATH\n"
        "  --dry-run           Use the in-memory adapter, no database needed\n"
        "  --verbose           Enable debug logging\n"
        "  --help              Show this help\n",
        prog);
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string adapter;
    std::string uri;
    std::string format = "text";
    std::string results_path;
    int iterations = -1;
    int warmup = -1;
    int threads = -1;
    int documents = -1;
    long long seed = -1;
    bool dry_run = false;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config_path = argv[++i];
            } else if (std::strcmp(argv[i], "--adapter") == 0 && i + 1 < argc) {
                adapter = argv[++i];
            } else if (std::strcmp(argv[i], "--uri") == 0 && i + 1 < argc) {
                uri = argv[++i];
            } else if (std::strcmp(argv[i], "--iterations") == 0 && i + 1 < argc) {
                iterations = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--warmup") == 0 && i + 1 < argc) {
                warmup = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
                threads = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--documents") == 0 && i + 1 < argc) {
                documents = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
                seed = std::stoll(argv[++i]);
            } else if (std::strcmp(argv[i], "--format") == 0 && i + 1 < argc) {
                format = argv[++i];
            } else if (std::strcmp(argv[i], "--results") == 0 && i + 1 < argc) {
                results_path = argv[++i];
            } else if (std::strcmp(argv[i], "--dry-run") == 0) {
                dry_run = true;
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                verbose = true;
            } else {
                std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Invalid numeric argument: %s\n", e.what());
        print_usage(argv[0]);
        return 1;
    }

    try {
        docbench::BenchmarkConfig cfg;
        if (!config_path.empty()) {
            cfg = docbench::BenchmarkConfig::from_json(config_path);
        }
        docbench::set_log_level(verbose ? docbench::LogLevel::DEBUG : docbench::parse_log_level(cfg.log_level));

        // Command line overrides the config file
        if (!adapter.empty()) cfg.connection.adapter = adapter;
        if (!uri.empty()) cfg.connection.uri = uri;
        if (iterations >= 0) cfg.measure_iterations = iterations;
        if (warmup >= 0) cfg.warmup_iterations = warmup;
        if (threads >= 0) cfg.threads = threads;
        if (documents >= 0) cfg.workload.document_count = documents;
        if (seed >= 0) cfg.workload.seed = static_cast<uint64_t>(seed);
        if (!results_path.empty()) cfg.results_file = results_path;
        if (dry_run) cfg.dry_run = true;

        if (cfg.dry_run) {
            LOG_INF("=== DRY RUN MODE === (in-memory adapter, no database)");
            cfg.connection.adapter = "memory";
        }

        auto errors = cfg.validate();
        if (!errors.empty()) throw docbench::ConfigurationError(std::move(errors));

        const docbench::OutputFormat out_format = docbench::parse_output_format(format);

        LOG_INF("=== docbench: latency overhead decomposition ===");

        docbench::BenchmarkRun run(cfg);
        docbench::RunReport report = run.run();

        docbench::ResultsExporter exporter(cfg);
        bool exported = true;
        if (!cfg.results_file.empty()) {
            exported = exporter.write_json(report, cfg.results_file);
        }
        exporter.print(report, out_format);

        LOG_INF("=== BENCHMARK COMPLETE ===");
        if (report.measured.failed > 0) {
            LOG_WRN("%lld measured operation(s) failed", static_cast<long long>(report.measured.failed));
        }
        return exported ? 0 : 1;
    } catch (const docbench::ConfigurationError& e) {
        LOG_ERR("%s", e.what());
        return 2;
    } catch (const docbench::DocbenchError& e) {
        LOG_ERR("%s", e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERR("Unexpected error: %s", e.what());
        return 1;
    }
}
