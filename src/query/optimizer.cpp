#include "query/optimizer.hpp"

#include "common/error.hpp"
#include "common/logger.hpp"
#include "document/key_encoding.hpp"
#include "query/access_path.hpp"

#include <utility>
#include <vector>

namespace docdb::query {

namespace {

std::shared_ptr<spdlog::logger> query_log() {
    static auto logger = make_component_logger("query");
    return logger;
}

// A comparison usable as an access path.
struct Candidate {
    bool on_pk = false;
    Index* index = nullptr;
    CompareOp op = CompareOp::Eq;
    Value operand;
};

void collect_conjuncts(const ExprPtr& e, std::vector<const Expr*>& out) {
    if (const auto* a = dynamic_cast<const AndExpr*>(e.get())) {
        collect_conjuncts(a->lhs(), out);
        collect_conjuncts(a->rhs(), out);
        return;
    }
    out.push_back(e.get());
}

CompareOp flip(CompareOp op) {
    switch (op) {
        case CompareOp::Gt:  return CompareOp::Lt;
        case CompareOp::Gte: return CompareOp::Lte;
        case CompareOp::Lt:  return CompareOp::Gt;
        case CompareOp::Lte: return CompareOp::Gte;
        default:             return op;
    }
}

// True when `e` selects the primary key or an indexed path of `table`.
bool match_path(const Expr* e, const Table& table, Candidate& c) {
    if (dynamic_cast<const KeyExpr*>(e)) {
        c.on_pk = true;
        return true;
    }
    const auto* f = dynamic_cast<const FieldExpr*>(e);
    if (!f) return false;

    const auto& pk = table.config().primary_key;
    if (!pk.empty() && f->path() == pk) {
        c.on_pk = true;
        return true;
    }
    if (auto* index = table.find_index(f->path())) {
        c.index = index;
        return true;
    }
    return false;
}

std::optional<Candidate> find_candidate(const std::vector<const Expr*>& conjuncts,
                                        const Table& table,
                                        const EvalStack& no_doc) {
    for (const Expr* e : conjuncts) {
        const auto* cmp = dynamic_cast<const ComparisonExpr*>(e);
        if (!cmp || cmp->op() == CompareOp::Neq) continue;

        Candidate c;
        if (match_path(cmp->lhs().get(), table, c) && !cmp->rhs()->eval(no_doc, c.operand)) {
            c.op = cmp->op();
            return c;
        }
        c = Candidate{};
        if (match_path(cmp->rhs().get(), table, c) && !cmp->lhs()->eval(no_doc, c.operand)) {
            c.op = flip(cmp->op());
            return c;
        }
    }
    return std::nullopt;
}

// Keys holding values that may satisfy `path OP v`.  May select more than
// the comparison accepts; the filter has the final word.
std::error_code range_for(CompareOp op, const Value& v, KeyRange& out) {
    std::string bound;
    if (auto ec = keys::encode_bound(v, bound)) return ec;
    const std::string tag = bound.substr(0, 1);

    // Encodings of arrays and documents do not follow their comparison
    // order: scan every value of that kind.
    if (v.type() == ValueType::Array || v.type() == ValueType::Document) {
        out = KeyRange{tag, tag};
        return {};
    }

    switch (op) {
        case CompareOp::Eq:
            out = KeyRange{bound, bound};
            break;
        case CompareOp::Gt:
        case CompareOp::Gte:
            out = KeyRange{bound, tag};
            break;
        case CompareOp::Lt:
        case CompareOp::Lte:
            out = KeyRange{tag, bound};
            break;
        case CompareOp::Neq:
            out = KeyRange{};
            break;
    }
    return {};
}

} // anonymous namespace

std::string QueryPlan::describe() const {
    switch (access) {
        case Access::FullScan:   return sorted ? "full scan + sort" : "full scan";
        case Access::PkRange:    return sorted ? "primary key range + sort" : "primary key range";
        case Access::PkOrder:    return "primary key order";
        case Access::IndexRange: return "index range on " + index + (sorted ? " + sort" : "");
        case Access::IndexOrder: return "index order on " + index;
    }
    return "unknown";
}

std::error_code QueryOptimizer::optimize(const QueryInput& in, Stream& out) {
    QueryPlan plan;
    return optimize(in, out, plan);
}

std::error_code QueryOptimizer::optimize(const QueryInput& in, Stream& out, QueryPlan& plan) {
    std::unique_ptr<Table> opened;
    if (auto ec = Table::open(tx_, in.table, opened)) return ec;
    std::shared_ptr<Table> table = std::move(opened);

    int64_t limit = -1;
    int64_t offset = 0;
    if (in.limit) {
        if (auto ec = eval_count_expr(*in.limit, in.params, limit)) return ec;
    }
    if (in.offset) {
        if (auto ec = eval_count_expr(*in.offset, in.params, offset)) return ec;
    }

    plan = QueryPlan{};
    plan.table = table;

    const EvalStack no_doc{.tx = &tx_, .config = &table->config(), .params = in.params};
    const auto& pk = table->config().primary_key;

    std::vector<const Expr*> conjuncts;
    if (in.where) {
        collect_conjuncts(in.where, conjuncts);
    }

    bool ordered = false;
    const bool descending = in.order_by && in.order_by->descending;
    std::unique_ptr<DocumentSource> source;

    if (auto c = find_candidate(conjuncts, *table, no_doc)) {
        KeyRange range;
        if (auto ec = range_for(c->op, c->operand, range)) return ec;

        if (c->on_pk) {
            ordered = in.order_by && !pk.empty() && in.order_by->path == pk;
            plan.access = QueryPlan::Access::PkRange;
            source = std::make_unique<TableScanSource>(table, std::move(range), ordered && descending);
        } else {
            ordered = in.order_by && in.order_by->path == c->index->config().path;
            plan.access = QueryPlan::Access::IndexRange;
            plan.index = c->index->config().name;
            source = std::make_unique<IndexScanSource>(table, *c->index, std::move(range),
                                                       ordered && descending);
        }
    } else if (in.order_by && !pk.empty() && in.order_by->path == pk) {
        ordered = true;
        plan.access = QueryPlan::Access::PkOrder;
        source = std::make_unique<TableScanSource>(table, KeyRange{}, descending);
    } else if (Index* index = in.order_by ? table->find_index(in.order_by->path) : nullptr) {
        ordered = true;
        plan.access = QueryPlan::Access::IndexOrder;
        plan.index = index->config().name;
        source = std::make_unique<IndexScanSource>(table, *index, KeyRange{}, descending);
    } else {
        plan.access = QueryPlan::Access::FullScan;
        source = std::make_unique<TableScanSource>(table, KeyRange{}, false);
    }

    Stream s(std::move(source));

    if (in.where) {
        s = std::move(s).filter(
            [table, tx = &tx_, params = in.params, where = in.where](const Document& doc, bool& keep)
                -> std::error_code {
                const EvalStack stack{.doc = &doc, .tx = tx, .config = &table->config(), .params = params};
                Value v;
                if (auto ec = where->eval(stack, v)) return ec;
                keep = v.is_truthy();
                return {};
            });
    }
    if (in.order_by && !ordered) {
        plan.sorted = true;
        s = std::move(s).sort(in.order_by->path, descending);
    }
    if (offset > 0) {
        s = std::move(s).offset(static_cast<uint64_t>(offset));
    }
    if (limit >= 0) {
        s = std::move(s).limit(static_cast<uint64_t>(limit));
    }

    query_log()->debug("Query on {}: {}", in.table, plan.describe());
    out = std::move(s);
    return {};
}

} // namespace docdb::query
