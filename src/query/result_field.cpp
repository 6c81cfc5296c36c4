#include "query/result_field.hpp"

#include "common/error.hpp"

#include <utility>

namespace docdb::query {

namespace {

constexpr std::string_view kKeyFuncName = "key()";

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

std::string result_field_name(const ResultField& field, const TableConfig* config) {
    return std::visit(overloaded{
        [](const ResultFieldExpr& f) {
            return f.name.empty() ? f.expr->to_string() : f.name;
        },
        [](const Wildcard&) {
            return std::string("*");
        },
        [config](const KeyFunc&) {
            if (config && !config->primary_key.empty()) {
                return config->primary_key.to_string();
            }
            return std::string(kKeyFuncName);
        },
    }, field);
}

std::error_code emit_result_field(const ResultField& field,
                                  const EvalStack& stack,
                                  const FieldFunc& fn) {
    return std::visit(overloaded{
        [&](const ResultFieldExpr& f) -> std::error_code {
            Value v;
            auto ec = f.expr->eval(stack, v);
            if (ec == errc::field_not_found) {
                return {};
            }
            if (ec) return ec;
            return fn(f.name.empty() ? f.expr->to_string() : f.name, v);
        },
        [&](const Wildcard&) -> std::error_code {
            if (!stack.doc) return {};
            return stack.doc->iterate(fn);
        },
        [&](const KeyFunc&) -> std::error_code {
            Value v;
            if (auto ec = KeyExpr{}.eval(stack, v)) return ec;
            return fn(result_field_name(field, stack.config), v);
        },
    }, field);
}

// ── DocumentMask ─────────────────────────────────────────────────────────────

DocumentMask::DocumentMask(DocumentPtr source,
                           std::shared_ptr<const std::vector<ResultField>> fields,
                           EvalStack stack)
    : source_(std::move(source))
    , fields_(std::move(fields))
    , stack_(stack)
{}

std::error_code DocumentMask::get_by_field(std::string_view field, Value& out) const {
    const auto s = stack();
    for (const auto& rf : *fields_) {
        if (std::holds_alternative<Wildcard>(rf)) {
            auto ec = source_->get_by_field(field, out);
            if (ec != errc::field_not_found) return ec;
            continue;
        }
        if (result_field_name(rf, s.config) != field) continue;

        bool found = false;
        auto ec = emit_result_field(rf, s, [&](std::string_view, const Value& v) -> std::error_code {
            out = v;
            found = true;
            return {};
        });
        if (ec) return ec;
        if (found) return {};
    }
    return make_error_code(errc::field_not_found);
}

std::error_code DocumentMask::iterate(const FieldFunc& fn) const {
    const auto s = stack();
    for (const auto& rf : *fields_) {
        if (auto ec = emit_result_field(rf, s, fn)) return ec;
    }
    return {};
}

} // namespace docdb::query
