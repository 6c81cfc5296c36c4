#include "query/statement.hpp"

#include "common/error.hpp"
#include "common/logger.hpp"
#include "document/key_encoding.hpp"

#include <string>
#include <utility>
#include <vector>

namespace docdb::query {

namespace {

std::shared_ptr<spdlog::logger> query_log() {
    static auto logger = make_component_logger("query");
    return logger;
}

// Runs the optimizer for a statement that only needs the matching rows.
std::error_code matching_rows(storage::Transaction& tx,
                              const std::string& table,
                              const ExprPtr& where,
                              const Params& params,
                              Stream& out,
                              QueryPlan& plan) {
    QueryInput in;
    in.table = table;
    in.where = where;
    in.params = &params;
    return QueryOptimizer(tx).optimize(in, out, plan);
}

} // anonymous namespace

// ── Result ───────────────────────────────────────────────────────────────────

Result& Result::operator=(Result&& other) noexcept {
    if (this != &other) {
        close();
        stream_ = std::move(other.stream_);
        fields_ = std::move(other.fields_);
        params_ = std::move(other.params_);
        tx_ = std::move(other.tx_);
        rows_affected_ = other.rows_affected_;
    }
    return *this;
}

void Result::close() {
    stream_ = Stream{};
    fields_.reset();
    params_.reset();
    if (tx_) {
        tx_->rollback();
        tx_.reset();
    }
}

// ── SELECT ───────────────────────────────────────────────────────────────────

std::error_code SelectStmt::run(storage::Transaction& tx, const Params& params, Result& out) const {
    auto bound = std::make_shared<const Params>(params);

    QueryInput in;
    in.table = table;
    in.where = where;
    in.order_by = order_by;
    in.limit = limit;
    in.offset = offset;
    in.params = bound.get();

    Stream s;
    QueryPlan plan;
    if (auto ec = QueryOptimizer(tx).optimize(in, s, plan)) return ec;

    auto projected = std::make_shared<const std::vector<ResultField>>(
        fields.empty() ? std::vector<ResultField>{Wildcard{}} : fields);
    const EvalStack base{.tx = &tx, .config = &plan.table->config(), .params = bound.get()};

    s = std::move(s).map(
        [projected, base, t = plan.table](const DocumentPtr& in, DocumentPtr& mapped) -> std::error_code {
            mapped = std::make_shared<DocumentMask>(in, projected, base);
            return {};
        });

    out = Result{};
    out.params_ = std::move(bound);
    out.fields_ = std::move(projected);
    out.stream_ = std::move(s);
    return {};
}

// ── DELETE ───────────────────────────────────────────────────────────────────

std::error_code DeleteStmt::run(storage::Transaction& tx, const Params& params, Result& out) const {
    Stream s;
    QueryPlan plan;
    if (auto ec = matching_rows(tx, table, where, params, s, plan)) return ec;

    std::vector<std::string> keys;
    auto ec = s.iterate([&keys](const DocumentPtr& doc) -> std::error_code {
        keys.emplace_back(doc->key());
        return {};
    });
    if (ec) return ec;

    for (const auto& key : keys) {
        if (auto ec = plan.table->del(key)) return ec;
    }

    query_log()->debug("Deleted {} rows from {}", keys.size(), table);
    out = Result{};
    out.rows_affected_ = keys.size();
    return {};
}

// ── UPDATE ───────────────────────────────────────────────────────────────────

std::error_code UpdateStmt::run(storage::Transaction& tx, const Params& params, Result& out) const {
    Stream s;
    QueryPlan plan;
    if (auto ec = matching_rows(tx, table, where, params, s, plan)) return ec;

    const auto& config = plan.table->config();
    std::vector<std::pair<std::string, FieldBuffer>> rows;

    auto ec = s.iterate([&](const DocumentPtr& doc) -> std::error_code {
        FieldBuffer updated;
        if (auto ec = updated.copy_from(*doc)) return ec;

        const EvalStack stack{.doc = doc.get(), .tx = &tx, .config = &config, .params = &params};
        for (const auto& [path, expr] : assignments) {
            Value v;
            if (auto ec = expr->eval(stack, v)) return ec;
            if (auto ec = path.set_value(updated, std::move(v))) return ec;
        }
        rows.emplace_back(std::string(doc->key()), std::move(updated));
        return {};
    });
    if (ec) return ec;

    // Rows whose primary key changes are all removed before any is
    // reinserted, so a key freed by one row can be taken by another.
    std::vector<std::size_t> moved;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (config.primary_key.empty()) break;
        Value pk;
        if (auto ec = config.primary_key.get_value(rows[i].second, pk)) return ec;
        std::string new_key;
        if (auto ec = keys::encode_value(pk, new_key)) return ec;
        if (new_key != rows[i].first) {
            moved.push_back(i);
        }
    }

    for (std::size_t i : moved) {
        if (auto ec = plan.table->del(rows[i].first)) return ec;
    }
    for (std::size_t i = 0, m = 0; i < rows.size(); ++i) {
        if (m < moved.size() && moved[m] == i) {
            ++m;
            continue;
        }
        if (auto ec = plan.table->replace(rows[i].first, rows[i].second)) return ec;
    }
    std::string new_key;
    for (std::size_t i : moved) {
        if (auto ec = plan.table->insert(rows[i].second, new_key)) return ec;
    }

    query_log()->debug("Updated {} rows in {}", rows.size(), table);
    out = Result{};
    out.rows_affected_ = rows.size();
    return {};
}

// ── INSERT ───────────────────────────────────────────────────────────────────

std::error_code InsertStmt::run(storage::Transaction& tx, const Params& params, Result& out) const {
    std::unique_ptr<Table> t;
    if (auto ec = Table::open(tx, table, t)) return ec;

    uint64_t inserted = 0;
    std::string key;
    for (const auto& doc : documents) {
        if (auto ec = t->insert(*doc, key)) return ec;
        ++inserted;
    }

    const EvalStack stack{.tx = &tx, .config = &t->config(), .params = &params};
    for (const auto& row : rows) {
        if (row.size() != field_names.size()) {
            return make_error_code(errc::type_mismatch);
        }
        FieldBuffer doc;
        for (std::size_t i = 0; i < row.size(); ++i) {
            Value v;
            if (auto ec = row[i]->eval(stack, v)) return ec;
            doc.add(field_names[i], std::move(v));
        }
        if (auto ec = t->insert(doc, key)) return ec;
        ++inserted;
    }

    query_log()->debug("Inserted {} rows into {}", inserted, table);
    out = Result{};
    out.rows_affected_ = inserted;
    return {};
}

// ── execute ──────────────────────────────────────────────────────────────────

std::error_code execute(Database& db,
                        const Statement& stmt,
                        const Params& params,
                        const storage::CancellationToken& token,
                        Result& out) {
    std::unique_ptr<storage::Transaction> tx;
    auto ec = db.begin(token, !stmt.is_read_only(), tx);
    if (!ec) {
        ec = stmt.run(*tx, params, out);
        if (ec) {
            tx->rollback();
        } else if (stmt.is_read_only()) {
            out.tx_ = std::move(tx);
        } else {
            ec = tx->commit();
        }
    }

    if (ec) {
        // Cancellation is requested by the caller, not a failure of the statement.
        if (is_cancellation(ec)) {
            query_log()->debug("Statement stopped: {}", ec.message());
        } else {
            query_log()->warn("Statement failed: {}", ec.message());
        }
    }
    return ec;
}

std::error_code execute(Database& db, const Statement& stmt, const Params& params, Result& out) {
    return execute(db, stmt, params, db.default_token(), out);
}

} // namespace docdb::query
