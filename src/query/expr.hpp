#pragma once

#include "document/document.hpp"
#include "query/eval_stack.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>

namespace docdb::query {

// ── Expr ─────────────────────────────────────────────────────────────────────
//
// Node of an expression tree.  eval() computes the value of the node for the
// document (and parameters, table, transaction) of `stack`.  A field that is
// absent from the document yields errc::field_not_found; callers decide
// whether that is fatal.

class Expr {
public:
    virtual ~Expr() = default;

    [[nodiscard]] virtual std::error_code eval(const EvalStack& stack, Value& out) const = 0;

    // Rendering used for result field names and log lines.
    [[nodiscard]] virtual std::string to_string() const = 0;
};

using ExprPtr = std::shared_ptr<const Expr>;

// ── Leaves ───────────────────────────────────────────────────────────────────

class LiteralExpr final : public Expr {
public:
    explicit LiteralExpr(Value value) : value_(std::move(value)) {}

    [[nodiscard]] std::error_code eval(const EvalStack& stack, Value& out) const override;
    [[nodiscard]] std::string to_string() const override { return value_.to_string(); }

    [[nodiscard]] const Value& value() const noexcept { return value_; }

private:
    Value value_;
};

// Value at a path of the current document.
class FieldExpr final : public Expr {
public:
    explicit FieldExpr(ValuePath path) : path_(std::move(path)) {}

    [[nodiscard]] std::error_code eval(const EvalStack& stack, Value& out) const override;
    [[nodiscard]] std::string to_string() const override { return path_.to_string(); }

    [[nodiscard]] const ValuePath& path() const noexcept { return path_; }

private:
    ValuePath path_;
};

// `?`, numbered from 1.
class PositionalParamExpr final : public Expr {
public:
    explicit PositionalParamExpr(std::size_t position) : position_(position) {}

    [[nodiscard]] std::error_code eval(const EvalStack& stack, Value& out) const override;
    [[nodiscard]] std::string to_string() const override { return "?"; }

private:
    std::size_t position_;
};

// `$name`.
class NamedParamExpr final : public Expr {
public:
    explicit NamedParamExpr(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] std::error_code eval(const EvalStack& stack, Value& out) const override;
    [[nodiscard]] std::string to_string() const override { return "$" + name_; }

private:
    std::string name_;
};

// `key()`: the primary key of the current document.  The value at the
// primary-key path when the table declares one, the decoded storage key
// otherwise.
class KeyExpr final : public Expr {
public:
    [[nodiscard]] std::error_code eval(const EvalStack& stack, Value& out) const override;
    [[nodiscard]] std::string to_string() const override { return "key()"; }
};

// ── Operators ────────────────────────────────────────────────────────────────

enum class CompareOp { Eq, Neq, Gt, Gte, Lt, Lte };

[[nodiscard]] const char* to_string(CompareOp op) noexcept;

// Yields a bool.  An operand reporting errc::field_not_found makes the
// comparison false; any other operand error is returned.  Values that are
// not comparable (different kinds, null against non-null) are unequal and
// unordered.
class ComparisonExpr final : public Expr {
public:
    ComparisonExpr(CompareOp op, ExprPtr lhs, ExprPtr rhs);

    [[nodiscard]] std::error_code eval(const EvalStack& stack, Value& out) const override;
    [[nodiscard]] std::string to_string() const override;

    [[nodiscard]] CompareOp op() const noexcept { return op_; }
    [[nodiscard]] const ExprPtr& lhs() const noexcept { return lhs_; }
    [[nodiscard]] const ExprPtr& rhs() const noexcept { return rhs_; }

private:
    CompareOp op_;
    ExprPtr lhs_;
    ExprPtr rhs_;
};

class AndExpr final : public Expr {
public:
    AndExpr(ExprPtr lhs, ExprPtr rhs);

    [[nodiscard]] std::error_code eval(const EvalStack& stack, Value& out) const override;
    [[nodiscard]] std::string to_string() const override;

    [[nodiscard]] const ExprPtr& lhs() const noexcept { return lhs_; }
    [[nodiscard]] const ExprPtr& rhs() const noexcept { return rhs_; }

private:
    ExprPtr lhs_;
    ExprPtr rhs_;
};

class OrExpr final : public Expr {
public:
    OrExpr(ExprPtr lhs, ExprPtr rhs);

    [[nodiscard]] std::error_code eval(const EvalStack& stack, Value& out) const override;
    [[nodiscard]] std::string to_string() const override;

private:
    ExprPtr lhs_;
    ExprPtr rhs_;
};

class NotExpr final : public Expr {
public:
    explicit NotExpr(ExprPtr operand);

    [[nodiscard]] std::error_code eval(const EvalStack& stack, Value& out) const override;
    [[nodiscard]] std::string to_string() const override;

private:
    ExprPtr operand_;
};

enum class ArithOp { Add, Sub, Mul, Div, Mod };

// Integer operands stay int64 unless the result overflows, which promotes
// the operation to float64.  A non-numeric operand or a zero divisor yields
// null.
class ArithmeticExpr final : public Expr {
public:
    ArithmeticExpr(ArithOp op, ExprPtr lhs, ExprPtr rhs);

    [[nodiscard]] std::error_code eval(const EvalStack& stack, Value& out) const override;
    [[nodiscard]] std::string to_string() const override;

private:
    ArithOp op_;
    ExprPtr lhs_;
    ExprPtr rhs_;
};

// ── Builders ─────────────────────────────────────────────────────────────────
//
//   auto where = and_(gt(field("age"), int_lit(18)), eq(field("city"), param("city")));

[[nodiscard]] ExprPtr lit(Value value);
[[nodiscard]] ExprPtr int_lit(int64_t v);
[[nodiscard]] ExprPtr float_lit(double v);
[[nodiscard]] ExprPtr text_lit(std::string v);
[[nodiscard]] ExprPtr field(std::string_view dotted_path);
[[nodiscard]] ExprPtr param(std::size_t position);
[[nodiscard]] ExprPtr param(std::string name);
[[nodiscard]] ExprPtr key_func();

[[nodiscard]] ExprPtr eq(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr neq(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr gt(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr gte(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr lt(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr lte(ExprPtr lhs, ExprPtr rhs);

[[nodiscard]] ExprPtr and_(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr or_(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr not_(ExprPtr operand);

[[nodiscard]] ExprPtr add(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr sub(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr mul(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr div(ExprPtr lhs, ExprPtr rhs);
[[nodiscard]] ExprPtr mod(ExprPtr lhs, ExprPtr rhs);

// Evaluates a LIMIT / OFFSET expression (without a document).
// errc::type_mismatch when the result is not a number or is negative,
// errc::conversion_failed when it is not an exact integer.
[[nodiscard]] std::error_code eval_count_expr(const Expr& expr, const Params* params, int64_t& out);

} // namespace docdb::query
