#include "common/config.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include "database/catalog.hpp"
#include "database/database.hpp"
#include "query/expr.hpp"
#include "query/statement.hpp"

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

constexpr const char* kUsage =
    "Usage: docdb-cli [options] <command> [args]\n"
    "\n"
    "Commands:\n"
    "  tables                 List tables\n"
    "  indexes [table]        List indexes, optionally of one table\n"
    "  count <table>          Number of rows of a table\n"
    "  dump <table> [limit]   Print the rows of a table\n";

// Prints the rendering of every field of `doc` on one line.
std::string format_document(const docdb::Document& doc) {
    std::string line = "{";
    bool first = true;
    auto ec = doc.iterate([&](std::string_view name, const docdb::Value& v) -> std::error_code {
        if (!first) line += ", ";
        first = false;
        line += '"';
        line.append(name);
        line += "\": ";
        line += v.to_string();
        return {};
    });
    if (ec) {
        return "<" + ec.message() + ">";
    }
    return line + "}";
}

int report(const char* what, const std::error_code& ec) {
    spdlog::error("docdb-cli: {} failed: {}", what, ec.message());
    return 1;
}

// ── Commands ──────────────────────────────────────────────────────────────────

int cmd_tables(docdb::Database& db) {
    std::vector<std::string> tables;
    auto ec = db.view([&](docdb::storage::Transaction& tx) {
        return docdb::Catalog(tx).list_tables(tables);
    });
    if (ec) return report("tables", ec);

    for (const auto& t : tables) {
        fprintf(stdout, "%s\n", t.c_str());
    }
    return 0;
}

int cmd_indexes(docdb::Database& db, const std::string& table) {
    std::vector<docdb::IndexConfig> indexes;
    auto ec = db.view([&](docdb::storage::Transaction& tx) {
        return docdb::Catalog(tx).list_indexes(table, indexes);
    });
    if (ec) return report("indexes", ec);

    for (const auto& i : indexes) {
        fprintf(stdout, "%s ON %s(%s)%s\n",
                i.name.c_str(), i.table_name.c_str(), i.path.to_string().c_str(),
                i.unique ? " UNIQUE" : "");
    }
    return 0;
}

int cmd_count(docdb::Database& db, const std::string& table) {
    docdb::query::SelectStmt stmt;
    stmt.table = table;

    docdb::query::Result result;
    if (auto ec = docdb::query::execute(db, stmt, {}, result)) return report("count", ec);

    uint64_t n = 0;
    if (auto ec = result.count(n)) return report("count", ec);
    fprintf(stdout, "%llu\n", static_cast<unsigned long long>(n));
    return 0;
}

int cmd_dump(docdb::Database& db, const std::string& table, int64_t limit) {
    docdb::query::SelectStmt stmt;
    stmt.table = table;
    stmt.fields = {docdb::query::KeyFunc{}, docdb::query::Wildcard{}};
    if (limit >= 0) {
        stmt.limit = docdb::query::int_lit(limit);
    }

    docdb::query::Result result;
    if (auto ec = docdb::query::execute(db, stmt, {}, result)) return report("dump", ec);

    auto ec = result.iterate([](const docdb::DocumentPtr& doc) -> std::error_code {
        fprintf(stdout, "%s\n", format_document(*doc).c_str());
        return {};
    });
    if (ec) return report("dump", ec);
    return 0;
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    po::options_description desc("docdb-cli options");
    docdb::add_options(desc);

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::vector<std::string>>(), "Command and arguments");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help") || !vm.count("command")) {
        std::ostringstream oss;
        oss << desc;
        fprintf(stdout, "%s\n%s\n", kUsage, oss.str().c_str());
        return vm.count("help") ? 0 : 1;
    }

    const auto args = vm["command"].as<std::vector<std::string>>();

    try {
        const auto cfg = docdb::load_config(vm);
        docdb::init_default_logger(docdb::parse_log_level(cfg.log_level));

        auto db = docdb::open_database(cfg);
        const auto& cmd = args.front();

        if (cmd == "tables") {
            return cmd_tables(*db);
        }
        if (cmd == "indexes") {
            return cmd_indexes(*db, args.size() > 1 ? args[1] : std::string{});
        }
        if (cmd == "count" && args.size() == 2) {
            return cmd_count(*db, args[1]);
        }
        if (cmd == "dump" && (args.size() == 2 || args.size() == 3)) {
            const int64_t limit = args.size() == 3 ? std::stoll(args[2]) : -1;
            return cmd_dump(*db, args[1], limit);
        }

        fprintf(stderr, "%s", kUsage);
        return 1;
    } catch (const std::exception& ex) {
        spdlog::error("docdb-cli: {}", ex.what());
        return 1;
    }
}
