#include "common/config.hpp"

#include <fmt/format.h>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace docdb {

// ── validate ──────────────────────────────────────────────────────────────────

void validate(const DatabaseConfig& cfg) {
    if (cfg.engine != "memory" && cfg.engine != "rocksdb") {
        throw std::runtime_error(
            fmt::format("--engine must be 'memory' or 'rocksdb', got '{}'", cfg.engine));
    }

    if (cfg.engine == "rocksdb" && cfg.data_dir.empty()) {
        throw std::runtime_error("--data-dir must not be empty for the rocksdb engine");
    }
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("engine",
            po::value<std::string>()->default_value("memory"),
            "Storage engine: memory (default) or rocksdb")
        ("data-dir",
            po::value<std::string>()->default_value("./data"),
            "Database directory (rocksdb engine)")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("query-timeout-ms",
            po::value<uint32_t>()->default_value(0),
            "Deadline applied to every transaction in milliseconds, 0 disables it")
        ("no-create",
            po::bool_switch(),
            "Fail instead of creating a missing database");
}

// ── load_config ───────────────────────────────────────────────────────────────

DatabaseConfig load_config(const po::variables_map& vm) {
    DatabaseConfig cfg;
    cfg.engine            = vm["engine"].as<std::string>();
    cfg.data_dir          = vm["data-dir"].as<std::string>();
    cfg.log_level         = vm["log-level"].as<std::string>();
    cfg.query_timeout_ms  = vm["query-timeout-ms"].as<uint32_t>();
    cfg.create_if_missing = !vm["no-create"].as<bool>();

    validate(cfg);
    return cfg;
}

// ── parse_config ──────────────────────────────────────────────────────────────

DatabaseConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("docdb options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        // Handle --help before notify() so missing required options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    return load_config(vm);
}

} // namespace docdb
