#pragma once

#include "document/document.hpp"
#include "query/eval_stack.hpp"
#include "query/expr.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace docdb::query {

// ── Result fields ────────────────────────────────────────────────────────────

// `expr [AS name]`.  An empty name stands for the rendering of the
// expression.
struct ResultFieldExpr {
    ExprPtr expr;
    std::string name;
};

// `*`
struct Wildcard {};

// `key()`
struct KeyFunc {};

using ResultField = std::variant<ResultFieldExpr, Wildcard, KeyFunc>;

// Name a result field is looked up by: the declared name of an expression,
// "*" for the wildcard, the primary-key path (or "key()") for KeyFunc.
[[nodiscard]] std::string result_field_name(const ResultField& field, const TableConfig* config);

// Emits the (name, value) pairs of `field` for the document of `stack`:
//   - expression: one pair, none when evaluation reports
//     errc::field_not_found, any other error is returned;
//   - wildcard: every field of the document;
//   - key(): the value at the primary-key path under the path's name, or the
//     decoded storage key under "key()" when the table has none.
[[nodiscard]] std::error_code emit_result_field(const ResultField& field,
                                                const EvalStack& stack,
                                                const FieldFunc& fn);

// ── DocumentMask ─────────────────────────────────────────────────────────────
//
// Projection of a source document through a list of result fields.  Only the
// projected fields are visible: get_by_field() answers from the result field
// whose name matches, or from the source when a wildcard is declared, and
// reports errc::field_not_found otherwise.

class DocumentMask final : public Document {
public:
    DocumentMask(DocumentPtr source,
                 std::shared_ptr<const std::vector<ResultField>> fields,
                 EvalStack stack);

    [[nodiscard]] std::error_code get_by_field(std::string_view field, Value& out) const override;
    [[nodiscard]] std::error_code iterate(const FieldFunc& fn) const override;
    [[nodiscard]] std::string_view key() const noexcept override { return source_->key(); }

private:
    [[nodiscard]] EvalStack stack() const {
        EvalStack s = stack_;
        s.doc = source_.get();
        return s;
    }

    DocumentPtr source_;
    std::shared_ptr<const std::vector<ResultField>> fields_;
    EvalStack stack_;
};

} // namespace docdb::query
