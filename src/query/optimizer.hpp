#pragma once

#include "database/table.hpp"
#include "query/expr.hpp"
#include "query/stream.hpp"
#include "storage/engine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace docdb::query {

struct OrderBy {
    ValuePath path;
    bool descending = false;
};

struct QueryInput {
    std::string table;
    ExprPtr where;                    // optional
    std::optional<OrderBy> order_by;
    ExprPtr limit;                    // optional
    ExprPtr offset;                   // optional
    const Params* params = nullptr;   // must outlive the stream
};

// How a query reads its table.  Filled by optimize().
struct QueryPlan {
    enum class Access { FullScan, PkRange, PkOrder, IndexRange, IndexOrder };

    std::shared_ptr<Table> table;
    Access access = Access::FullScan;
    std::string index;        // index name for IndexRange / IndexOrder
    bool sorted = false;      // a sort stage was added for ORDER BY

    [[nodiscard]] std::string describe() const;
};

// ── QueryOptimizer ───────────────────────────────────────────────────────────
//
// Picks an access path with a fixed rule order, first match wins:
//
//   1. a top-level AND conjunct `path OP operand` (OP one of = > >= < <=,
//      either side) whose operand does not depend on the document, on the
//      primary key (key range scan) or an indexed path (index range scan);
//   2. ORDER BY on the primary key or an indexed path: full scan in that
//      order;
//   3. full table scan in storage key order.
//
// The stream always applies WHERE as a filter, then ORDER BY as a sort
// unless the access path already yields that order (it is then read in the
// requested direction), then OFFSET, then LIMIT.  Errors are reported before
// any stream is built.

class QueryOptimizer {
public:
    explicit QueryOptimizer(storage::Transaction& tx) : tx_(tx) {}

    [[nodiscard]] std::error_code optimize(const QueryInput& in, Stream& out);

    [[nodiscard]] std::error_code optimize(const QueryInput& in, Stream& out, QueryPlan& plan);

private:
    storage::Transaction& tx_;
};

} // namespace docdb::query
