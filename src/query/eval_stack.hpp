#pragma once

#include "database/catalog.hpp"
#include "document/document.hpp"
#include "storage/engine.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace docdb::query {

// ── Params ───────────────────────────────────────────────────────────────────
//
// Values bound to a statement.  Positional parameters (`?`) are numbered
// from 1 in the order they were added; named parameters (`$name`) are looked
// up by name.  Both lookups fail with errc::param_not_found.

class Params {
public:
    Params() = default;

    Params& add(Value value) {
        positional_.push_back(std::move(value));
        return *this;
    }

    Params& add(std::string name, Value value) {
        named_.emplace_back(std::move(name), std::move(value));
        return *this;
    }

    [[nodiscard]] std::error_code get(std::size_t position, Value& out) const;
    [[nodiscard]] std::error_code get(std::string_view name, Value& out) const;

private:
    std::vector<Value> positional_;
    std::vector<std::pair<std::string, Value>> named_;
};

// ── EvalStack ────────────────────────────────────────────────────────────────
//
// Context of one evaluation.  Built per document on the caller's stack and
// never stored; every member is a non-owning pointer and may be null (LIMIT
// and OFFSET are evaluated without a document).

struct EvalStack {
    const Document* doc = nullptr;
    storage::Transaction* tx = nullptr;
    const TableConfig* config = nullptr;
    const Params* params = nullptr;
};

} // namespace docdb::query
