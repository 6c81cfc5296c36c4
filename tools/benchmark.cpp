// Query benchmark: compares a full table scan with an index seek.
//
// Fills a "users" table (primary key "id", secondary index on "age") in an
// in-memory database, then runs the same equality query twice per round:
// once on the indexed "age" field and once on "age_copy", which holds the
// same value but has no index, so the optimizer falls back to a full scan.
//
// Prints: total queries, elapsed time, queries/sec, and latency percentiles
// (p50, p90, p99, p999) for each access path.

#include "database/catalog.hpp"
#include "database/database.hpp"
#include "query/expr.hpp"
#include "query/statement.hpp"
#include "storage/memory_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

namespace {

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

constexpr int64_t kDistinctAges = 100;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = static_cast<double>(r.total_ops) / r.elapsed_sec;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total queries: %zu\n"
        "  Elapsed:       %.3f s\n"
        "  Throughput:    %.0f queries/sec\n"
        "  Avg latency:   %.1f µs\n"
        "  p50:           %.1f µs\n"
        "  p90:           %.1f µs\n"
        "  p99:           %.1f µs\n"
        "  p99.9:         %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

// ── Setup ────────────────────────────────────────────────────────────────────

bool load_users(docdb::Database& db, std::size_t num_rows) {
    auto ec = db.update([&](docdb::storage::Transaction& tx) -> std::error_code {
        docdb::Catalog catalog(tx);
        if (auto ec = catalog.create_table({.name = "users",
                                            .primary_key = docdb::ValuePath::parse("id")})) {
            return ec;
        }
        if (auto ec = catalog.create_index({.name = "users_age",
                                            .table_name = "users",
                                            .path = docdb::ValuePath::parse("age")})) {
            return ec;
        }

        docdb::query::InsertStmt insert;
        insert.table = "users";
        insert.documents.reserve(num_rows);
        for (std::size_t i = 0; i < num_rows; ++i) {
            const auto age = static_cast<int64_t>(i) % kDistinctAges;
            auto doc = std::make_shared<docdb::FieldBuffer>();
            doc->add("id", docdb::Value::integer(static_cast<int64_t>(i)))
                .add("name", docdb::Value::text("user" + std::to_string(i)))
                .add("age", docdb::Value::integer(age))
                .add("age_copy", docdb::Value::integer(age));
            insert.documents.push_back(std::move(doc));
        }

        docdb::query::Result result;
        return insert.run(tx, {}, result);
    });
    if (ec) {
        fprintf(stderr, "load failed: %s\n", ec.message().c_str());
        return false;
    }
    return true;
}

// ── Benchmark runner ─────────────────────────────────────────────────────────

// Runs `num_queries` equality lookups on `field` and records their latency.
// Returns false if a query fails.
bool bench_lookup(docdb::Database& db, const char* field, std::size_t num_queries,
                  BenchResult& out) {
    std::vector<int64_t> latencies;
    latencies.reserve(num_queries);

    docdb::query::SelectStmt stmt;
    stmt.table = "users";
    stmt.where = docdb::query::eq(docdb::query::field(field), docdb::query::param(1));

    for (std::size_t i = 0; i < num_queries; ++i) {
        docdb::query::Params params;
        params.add(docdb::Value::integer(static_cast<int64_t>(i) % kDistinctAges));

        auto t0 = clock::now();
        docdb::query::Result result;
        uint64_t n = 0;
        auto ec = docdb::query::execute(db, stmt, params, result);
        if (!ec) ec = result.count(n);
        auto t1 = clock::now();

        if (ec) {
            fprintf(stderr, "query on %s failed: %s\n", field, ec.message().c_str());
            return false;
        }
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }

    out = compute_stats(latencies);
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_rows = 10'000;
    if (argc > 1) {
        num_rows = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_rows == 0) num_rows = 10'000;
    }
    std::size_t num_queries = 1'000;
    if (argc > 2) {
        num_queries = static_cast<std::size_t>(std::atol(argv[2]));
        if (num_queries == 0) num_queries = 1'000;
    }

    fprintf(stdout,
        "docdb Query Benchmark\n"
        "=====================\n"
        "Rows:     %zu (%lld distinct ages)\n"
        "Queries:  %zu per access path\n",
        num_rows, static_cast<long long>(kDistinctAges), num_queries);

    docdb::Database db{std::make_unique<docdb::storage::MemoryEngine>()};
    if (!load_users(db, num_rows)) return 1;

    BenchResult scan_result;
    BenchResult index_result;
    if (!bench_lookup(db, "age_copy", num_queries, scan_result)) return 1;
    if (!bench_lookup(db, "age", num_queries, index_result)) return 1;

    print_result("Full Scan", scan_result);
    print_result("Index Seek", index_result);

    if (scan_result.ops_per_sec > 0 && index_result.ops_per_sec > 0) {
        fprintf(stdout,
            "\n── Comparison ──\n"
            "  Index / Scan throughput ratio: %.2fx\n"
            "  Index avg latency savings:     %.1f%%\n",
            index_result.ops_per_sec / scan_result.ops_per_sec,
            (1.0 - index_result.avg_us / scan_result.avg_us) * 100.0);
    }

    fprintf(stdout, "\n");
    return 0;
}
