#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace docdb {

// ── DatabaseConfig ────────────────────────────────────────────────────────────
// Configuration for one embedded database instance.
// Populated by parse_config() / load_config() from CLI arguments.

struct DatabaseConfig {
    std::string engine = "memory";      // Storage engine: "memory" or "rocksdb"
    std::string data_dir = "./data";    // Directory for the rocksdb engine
    std::string log_level = "info";     // spdlog level string
    uint32_t    query_timeout_ms = 0;   // Per-transaction deadline, 0 = none
    bool        create_if_missing = true;
};

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with the database
// options.  Tools add their own options on top of these.

void add_options(boost::program_options::options_description& desc);

// ── load_config ───────────────────────────────────────────────────────────────
// Build a DatabaseConfig from an already-notified variables_map.
// Throws std::runtime_error if validation fails:
//   - engine must be "memory" or "rocksdb"
//   - data_dir must not be empty when engine is "rocksdb"

[[nodiscard]] DatabaseConfig load_config(
    const boost::program_options::variables_map& vm);

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a DatabaseConfig.
//
// On success: returns a fully validated DatabaseConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (including the help text when --help is given).

[[nodiscard]] DatabaseConfig parse_config(int argc, char* argv[]);

// Throws std::runtime_error describing the first invalid setting.
void validate(const DatabaseConfig& cfg);

} // namespace docdb
