#include "query/expr.hpp"

#include "common/error.hpp"
#include "document/key_encoding.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace docdb::query {

// ── Params ───────────────────────────────────────────────────────────────────

std::error_code Params::get(std::size_t position, Value& out) const {
    if (position == 0 || position > positional_.size()) {
        return make_error_code(errc::param_not_found);
    }
    out = positional_[position - 1];
    return {};
}

std::error_code Params::get(std::string_view name, Value& out) const {
    for (const auto& [n, v] : named_) {
        if (n == name) {
            out = v;
            return {};
        }
    }
    return make_error_code(errc::param_not_found);
}

namespace {

ExprPtr require(ExprPtr e) {
    if (!e) {
        throw std::logic_error("expression operand must not be null");
    }
    return e;
}

// ── Integer arithmetic with overflow detection ───────────────────────────────

constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
constexpr int64_t kMax = std::numeric_limits<int64_t>::max();

bool add_overflows(int64_t a, int64_t b) {
    return (b > 0 && a > kMax - b) || (b < 0 && a < kMin - b);
}

bool sub_overflows(int64_t a, int64_t b) {
    return (b < 0 && a > kMax + b) || (b > 0 && a < kMin + b);
}

bool mul_overflows(int64_t a, int64_t b) {
    if (a == 0 || b == 0) return false;
    if (a > 0) {
        return b > 0 ? a > kMax / b : b < kMin / a;
    }
    return b > 0 ? a < kMin / b : b < kMax / a;
}

// Returns false when the integer result does not fit in int64 and the
// operation has to be redone in float64.
bool int_arith(ArithOp op, int64_t a, int64_t b, Value& out) {
    switch (op) {
        case ArithOp::Add:
            if (add_overflows(a, b)) return false;
            out = Value::int64(a + b);
            return true;
        case ArithOp::Sub:
            if (sub_overflows(a, b)) return false;
            out = Value::int64(a - b);
            return true;
        case ArithOp::Mul:
            if (mul_overflows(a, b)) return false;
            out = Value::int64(a * b);
            return true;
        case ArithOp::Div:
            if (b == 0) {
                out = Value::null();
                return true;
            }
            if (a == kMin && b == -1) return false;
            out = Value::int64(a / b);
            return true;
        case ArithOp::Mod:
            if (b == 0) {
                out = Value::null();
                return true;
            }
            out = Value::int64(b == -1 ? 0 : a % b);
            return true;
    }
    out = Value::null();
    return true;
}

Value float_arith(ArithOp op, double a, double b) {
    switch (op) {
        case ArithOp::Add: return Value::float64(a + b);
        case ArithOp::Sub: return Value::float64(a - b);
        case ArithOp::Mul: return Value::float64(a * b);
        case ArithOp::Div:
            if (b == 0.0) return Value::null();
            return Value::float64(a / b);
        case ArithOp::Mod:
            if (b == 0.0) return Value::null();
            return Value::float64(std::fmod(a, b));
    }
    return Value::null();
}

const char* symbol(ArithOp op) {
    switch (op) {
        case ArithOp::Add: return "+";
        case ArithOp::Sub: return "-";
        case ArithOp::Mul: return "*";
        case ArithOp::Div: return "/";
        case ArithOp::Mod: return "%";
    }
    return "?";
}

} // anonymous namespace

const char* to_string(CompareOp op) noexcept {
    switch (op) {
        case CompareOp::Eq:  return "=";
        case CompareOp::Neq: return "!=";
        case CompareOp::Gt:  return ">";
        case CompareOp::Gte: return ">=";
        case CompareOp::Lt:  return "<";
        case CompareOp::Lte: return "<=";
    }
    return "?";
}

// ── Leaves ───────────────────────────────────────────────────────────────────

std::error_code LiteralExpr::eval(const EvalStack&, Value& out) const {
    out = value_;
    return {};
}

std::error_code FieldExpr::eval(const EvalStack& stack, Value& out) const {
    if (!stack.doc) {
        return make_error_code(errc::field_not_found);
    }
    return path_.get_value(*stack.doc, out);
}

std::error_code PositionalParamExpr::eval(const EvalStack& stack, Value& out) const {
    if (!stack.params) {
        return make_error_code(errc::param_not_found);
    }
    return stack.params->get(position_, out);
}

std::error_code NamedParamExpr::eval(const EvalStack& stack, Value& out) const {
    if (!stack.params) {
        return make_error_code(errc::param_not_found);
    }
    return stack.params->get(std::string_view{name_}, out);
}

std::error_code KeyExpr::eval(const EvalStack& stack, Value& out) const {
    if (!stack.doc) {
        return make_error_code(errc::field_not_found);
    }
    if (stack.config && !stack.config->primary_key.empty()) {
        return stack.config->primary_key.get_value(*stack.doc, out);
    }

    std::string_view key = stack.doc->key();
    if (key.empty()) {
        return make_error_code(errc::field_not_found);
    }
    return keys::decode_value(key, out);
}

// ── Comparison ───────────────────────────────────────────────────────────────

ComparisonExpr::ComparisonExpr(CompareOp op, ExprPtr lhs, ExprPtr rhs)
    : op_(op)
    , lhs_(require(std::move(lhs)))
    , rhs_(require(std::move(rhs)))
{}

std::error_code ComparisonExpr::eval(const EvalStack& stack, Value& out) const {
    Value l;
    Value r;
    for (auto [expr, value] : {std::pair{lhs_.get(), &l}, std::pair{rhs_.get(), &r}}) {
        if (auto ec = expr->eval(stack, *value)) {
            if (ec == errc::field_not_found) {
                out = Value::boolean(false);
                return {};
            }
            return ec;
        }
    }

    const auto c = compare_values(l, r);
    bool result = false;
    switch (op_) {
        case CompareOp::Eq:  result = c && *c == 0; break;
        case CompareOp::Neq: result = !c || *c != 0; break;
        case CompareOp::Gt:  result = c && *c > 0; break;
        case CompareOp::Gte: result = c && *c >= 0; break;
        case CompareOp::Lt:  result = c && *c < 0; break;
        case CompareOp::Lte: result = c && *c <= 0; break;
    }
    out = Value::boolean(result);
    return {};
}

std::string ComparisonExpr::to_string() const {
    return lhs_->to_string() + " " + query::to_string(op_) + " " + rhs_->to_string();
}

// ── Logical ──────────────────────────────────────────────────────────────────

AndExpr::AndExpr(ExprPtr lhs, ExprPtr rhs)
    : lhs_(require(std::move(lhs)))
    , rhs_(require(std::move(rhs)))
{}

std::error_code AndExpr::eval(const EvalStack& stack, Value& out) const {
    Value v;
    if (auto ec = lhs_->eval(stack, v)) return ec;
    if (!v.is_truthy()) {
        out = Value::boolean(false);
        return {};
    }
    if (auto ec = rhs_->eval(stack, v)) return ec;
    out = Value::boolean(v.is_truthy());
    return {};
}

std::string AndExpr::to_string() const {
    return "(" + lhs_->to_string() + " AND " + rhs_->to_string() + ")";
}

OrExpr::OrExpr(ExprPtr lhs, ExprPtr rhs)
    : lhs_(require(std::move(lhs)))
    , rhs_(require(std::move(rhs)))
{}

std::error_code OrExpr::eval(const EvalStack& stack, Value& out) const {
    Value v;
    if (auto ec = lhs_->eval(stack, v)) return ec;
    if (v.is_truthy()) {
        out = Value::boolean(true);
        return {};
    }
    if (auto ec = rhs_->eval(stack, v)) return ec;
    out = Value::boolean(v.is_truthy());
    return {};
}

std::string OrExpr::to_string() const {
    return "(" + lhs_->to_string() + " OR " + rhs_->to_string() + ")";
}

NotExpr::NotExpr(ExprPtr operand)
    : operand_(require(std::move(operand)))
{}

std::error_code NotExpr::eval(const EvalStack& stack, Value& out) const {
    Value v;
    if (auto ec = operand_->eval(stack, v)) return ec;
    out = Value::boolean(!v.is_truthy());
    return {};
}

std::string NotExpr::to_string() const {
    return "NOT " + operand_->to_string();
}

// ── Arithmetic ───────────────────────────────────────────────────────────────

ArithmeticExpr::ArithmeticExpr(ArithOp op, ExprPtr lhs, ExprPtr rhs)
    : op_(op)
    , lhs_(require(std::move(lhs)))
    , rhs_(require(std::move(rhs)))
{}

std::error_code ArithmeticExpr::eval(const EvalStack& stack, Value& out) const {
    Value l;
    Value r;
    if (auto ec = lhs_->eval(stack, l)) return ec;
    if (auto ec = rhs_->eval(stack, r)) return ec;

    if (!l.is_number() || !r.is_number()) {
        out = Value::null();
        return {};
    }

    if (l.is_integer() && r.is_integer() && int_arith(op_, l.as_int64(), r.as_int64(), out)) {
        return {};
    }

    double a = 0;
    double b = 0;
    if (auto ec = l.convert_to_float64(a)) return ec;
    if (auto ec = r.convert_to_float64(b)) return ec;
    out = float_arith(op_, a, b);
    return {};
}

std::string ArithmeticExpr::to_string() const {
    return lhs_->to_string() + " " + symbol(op_) + " " + rhs_->to_string();
}

// ── Builders ─────────────────────────────────────────────────────────────────

ExprPtr lit(Value value) { return std::make_shared<LiteralExpr>(std::move(value)); }
ExprPtr int_lit(int64_t v) { return lit(Value::int64(v)); }
ExprPtr float_lit(double v) { return lit(Value::float64(v)); }
ExprPtr text_lit(std::string v) { return lit(Value::text(std::move(v))); }

ExprPtr field(std::string_view dotted_path) {
    return std::make_shared<FieldExpr>(ValuePath::parse(dotted_path));
}

ExprPtr param(std::size_t position) { return std::make_shared<PositionalParamExpr>(position); }
ExprPtr param(std::string name) { return std::make_shared<NamedParamExpr>(std::move(name)); }
ExprPtr key_func() { return std::make_shared<KeyExpr>(); }

ExprPtr eq(ExprPtr l, ExprPtr r)  { return std::make_shared<ComparisonExpr>(CompareOp::Eq, std::move(l), std::move(r)); }
ExprPtr neq(ExprPtr l, ExprPtr r) { return std::make_shared<ComparisonExpr>(CompareOp::Neq, std::move(l), std::move(r)); }
ExprPtr gt(ExprPtr l, ExprPtr r)  { return std::make_shared<ComparisonExpr>(CompareOp::Gt, std::move(l), std::move(r)); }
ExprPtr gte(ExprPtr l, ExprPtr r) { return std::make_shared<ComparisonExpr>(CompareOp::Gte, std::move(l), std::move(r)); }
ExprPtr lt(ExprPtr l, ExprPtr r)  { return std::make_shared<ComparisonExpr>(CompareOp::Lt, std::move(l), std::move(r)); }
ExprPtr lte(ExprPtr l, ExprPtr r) { return std::make_shared<ComparisonExpr>(CompareOp::Lte, std::move(l), std::move(r)); }

ExprPtr and_(ExprPtr l, ExprPtr r) { return std::make_shared<AndExpr>(std::move(l), std::move(r)); }
ExprPtr or_(ExprPtr l, ExprPtr r)  { return std::make_shared<OrExpr>(std::move(l), std::move(r)); }
ExprPtr not_(ExprPtr operand)      { return std::make_shared<NotExpr>(std::move(operand)); }

ExprPtr add(ExprPtr l, ExprPtr r) { return std::make_shared<ArithmeticExpr>(ArithOp::Add, std::move(l), std::move(r)); }
ExprPtr sub(ExprPtr l, ExprPtr r) { return std::make_shared<ArithmeticExpr>(ArithOp::Sub, std::move(l), std::move(r)); }
ExprPtr mul(ExprPtr l, ExprPtr r) { return std::make_shared<ArithmeticExpr>(ArithOp::Mul, std::move(l), std::move(r)); }
ExprPtr div(ExprPtr l, ExprPtr r) { return std::make_shared<ArithmeticExpr>(ArithOp::Div, std::move(l), std::move(r)); }
ExprPtr mod(ExprPtr l, ExprPtr r) { return std::make_shared<ArithmeticExpr>(ArithOp::Mod, std::move(l), std::move(r)); }

// ── LIMIT / OFFSET ───────────────────────────────────────────────────────────

std::error_code eval_count_expr(const Expr& expr, const Params* params, int64_t& out) {
    Value v;
    if (auto ec = expr.eval(EvalStack{.params = params}, v)) return ec;
    if (!v.is_number()) {
        return make_error_code(errc::type_mismatch);
    }
    if (auto ec = v.convert_to_int64(out)) return ec;
    if (out < 0) {
        return make_error_code(errc::type_mismatch);
    }
    return {};
}

} // namespace docdb::query
