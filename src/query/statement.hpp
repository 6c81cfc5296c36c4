#pragma once

#include "database/database.hpp"
#include "query/eval_stack.hpp"
#include "query/expr.hpp"
#include "query/optimizer.hpp"
#include "query/result_field.hpp"
#include "query/stream.hpp"
#include "storage/engine.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docdb::query {

class Statement;

// ── Result ───────────────────────────────────────────────────────────────────
//
// Outcome of a statement.  A SELECT result holds the projected stream, and
// keeps alive everything the stream reads through (parameters, result
// fields and, when produced by execute(), the read transaction) until it is
// closed or destroyed.  Other statements only report rows_affected().

class Result {
public:
    Result() = default;
    ~Result() { close(); }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&& other) noexcept;

    Result(const Result&)            = delete;
    Result& operator=(const Result&) = delete;

    [[nodiscard]] std::error_code iterate(const Stream::Visitor& fn) { return stream_.iterate(fn); }

    [[nodiscard]] std::error_code count(uint64_t& out) { return stream_.count(out); }

    [[nodiscard]] uint64_t rows_affected() const noexcept { return rows_affected_; }

    // Closes the stream, then ends the transaction owned by the result.
    void close();

private:
    friend class SelectStmt;
    friend class DeleteStmt;
    friend class UpdateStmt;
    friend class InsertStmt;
    friend std::error_code execute(Database&, const Statement&, const Params&,
                                   const storage::CancellationToken&, Result&);
    friend std::error_code execute(Database&, const Statement&, const Params&, Result&);

    // Declaration order is destruction order in reverse: the stream goes
    // first, the transaction last.
    std::unique_ptr<storage::Transaction> tx_;
    std::shared_ptr<const Params> params_;
    std::shared_ptr<const std::vector<ResultField>> fields_;
    Stream stream_;
    uint64_t rows_affected_ = 0;
};

// ── Statement ────────────────────────────────────────────────────────────────

class Statement {
public:
    virtual ~Statement() = default;

    // Runs the statement inside `tx`.  A failed statement may leave `tx`
    // partially modified; the caller rolls it back.
    [[nodiscard]] virtual std::error_code run(storage::Transaction& tx,
                                              const Params& params,
                                              Result& out) const = 0;

    [[nodiscard]] virtual bool is_read_only() const noexcept = 0;
};

// SELECT fields FROM table [WHERE] [ORDER BY] [LIMIT] [OFFSET]
// No result fields means `*`.
class SelectStmt final : public Statement {
public:
    std::string table;
    ExprPtr where;
    std::optional<OrderBy> order_by;
    ExprPtr limit;
    ExprPtr offset;
    std::vector<ResultField> fields;

    [[nodiscard]] std::error_code run(storage::Transaction& tx,
                                      const Params& params,
                                      Result& out) const override;

    [[nodiscard]] bool is_read_only() const noexcept override { return true; }
};

// DELETE FROM table [WHERE].  Matching keys are collected first, then the
// rows are deleted.
class DeleteStmt final : public Statement {
public:
    std::string table;
    ExprPtr where;

    [[nodiscard]] std::error_code run(storage::Transaction& tx,
                                      const Params& params,
                                      Result& out) const override;

    [[nodiscard]] bool is_read_only() const noexcept override { return false; }
};

// UPDATE table SET path = expr, ... [WHERE].  Expressions see the row as it
// was before the statement.  Assigning a new primary key moves the row.
class UpdateStmt final : public Statement {
public:
    std::string table;
    std::vector<std::pair<ValuePath, ExprPtr>> assignments;
    ExprPtr where;

    [[nodiscard]] std::error_code run(storage::Transaction& tx,
                                      const Params& params,
                                      Result& out) const override;

    [[nodiscard]] bool is_read_only() const noexcept override { return false; }
};

// INSERT INTO table documents, or INSERT INTO table (fields) VALUES rows.
// Each row must have one expression per field (errc::type_mismatch).
class InsertStmt final : public Statement {
public:
    std::string table;
    std::vector<DocumentPtr> documents;
    std::vector<std::string> field_names;
    std::vector<std::vector<ExprPtr>> rows;

    [[nodiscard]] std::error_code run(storage::Transaction& tx,
                                      const Params& params,
                                      Result& out) const override;

    [[nodiscard]] bool is_read_only() const noexcept override { return false; }
};

// ── execute ──────────────────────────────────────────────────────────────────
//
// Runs `stmt` in a new transaction of the right kind.  Writes are committed
// when the statement succeeds and rolled back otherwise; a SELECT result
// takes the read transaction with it.

[[nodiscard]] std::error_code execute(Database& db,
                                      const Statement& stmt,
                                      const Params& params,
                                      const storage::CancellationToken& token,
                                      Result& out);

// Same, with the database's default token (query timeout).
[[nodiscard]] std::error_code execute(Database& db,
                                      const Statement& stmt,
                                      const Params& params,
                                      Result& out);

} // namespace docdb::query
