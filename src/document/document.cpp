#include "document/document.hpp"

#include "common/error.hpp"

#include <algorithm>
#include <charconv>
#include <memory>

namespace docdb {

// ── FieldBuffer ──────────────────────────────────────────────────────────────

FieldBuffer& FieldBuffer::add(std::string field, Value value) {
    fields_.emplace_back(std::move(field), std::move(value));
    return *this;
}

void FieldBuffer::set(std::string_view field, Value value) {
    for (auto& [name, v] : fields_) {
        if (name == field) {
            v = std::move(value);
            return;
        }
    }
    fields_.emplace_back(std::string(field), std::move(value));
}

bool FieldBuffer::remove(std::string_view field) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const auto& f) { return f.first == field; });
    if (it == fields_.end()) {
        return false;
    }
    fields_.erase(it);
    return true;
}

std::error_code FieldBuffer::copy_from(const Document& doc) {
    fields_.clear();
    key_ = std::string(doc.key());
    return doc.iterate([this](std::string_view field, const Value& v) -> std::error_code {
        fields_.emplace_back(std::string(field), v);
        return {};
    });
}

std::error_code FieldBuffer::get_by_field(std::string_view field, Value& out) const {
    for (const auto& [name, v] : fields_) {
        if (name == field) {
            out = v;
            return {};
        }
    }
    return make_error_code(errc::field_not_found);
}

std::error_code FieldBuffer::iterate(const FieldFunc& fn) const {
    for (const auto& [name, v] : fields_) {
        if (auto ec = fn(name, v)) {
            return ec;
        }
    }
    return {};
}

// ── ValuePath ────────────────────────────────────────────────────────────────

namespace {

[[nodiscard]] std::error_code set_in_document(FieldBuffer& buf,
                                              const std::vector<PathFragment>& frags,
                                              std::size_t i,
                                              Value value);

// Returns a copy of `current` with `value` written at frags[i..].
[[nodiscard]] std::error_code set_in_value(const Value& current,
                                           const std::vector<PathFragment>& frags,
                                           std::size_t i,
                                           Value value,
                                           Value& out) {
    const auto& frag = frags[i];
    const bool last = i + 1 == frags.size();

    if (current.type() == ValueType::Document) {
        auto copy = std::make_shared<FieldBuffer>();
        if (auto ec = copy->copy_from(current.as_document())) return ec;
        if (auto ec = set_in_document(*copy, frags, i, std::move(value))) return ec;
        out = Value::document(std::move(copy));
        return {};
    }

    if (current.type() == ValueType::Array) {
        if (!frag.index || *frag.index >= current.as_array().size()) {
            return make_error_code(errc::field_not_found);
        }
        ValueArray items = current.as_array();
        auto& slot = items[*frag.index];
        if (last) {
            slot = std::move(value);
        } else {
            Value nested;
            if (auto ec = set_in_value(slot, frags, i + 1, std::move(value), nested)) return ec;
            slot = std::move(nested);
        }
        out = Value::array(std::move(items));
        return {};
    }

    return make_error_code(errc::type_mismatch);
}

std::error_code set_in_document(FieldBuffer& buf,
                                const std::vector<PathFragment>& frags,
                                std::size_t i,
                                Value value) {
    const auto& frag = frags[i];
    if (i + 1 == frags.size()) {
        buf.set(frag.field, std::move(value));
        return {};
    }

    Value current;
    if (auto ec = buf.get_by_field(frag.field, current)) return ec;

    Value updated;
    if (auto ec = set_in_value(current, frags, i + 1, std::move(value), updated)) return ec;
    buf.set(frag.field, std::move(updated));
    return {};
}

} // anonymous namespace

ValuePath::ValuePath(std::vector<PathFragment> fragments)
    : fragments_(std::move(fragments))
{}

ValuePath ValuePath::parse(std::string_view dotted) {
    std::vector<PathFragment> frags;
    while (!dotted.empty()) {
        auto dot = dotted.find('.');
        std::string_view part = dotted.substr(0, dot);
        dotted = (dot == std::string_view::npos) ? std::string_view{} : dotted.substr(dot + 1);

        PathFragment frag;
        frag.field = std::string(part);
        if (!frags.empty() && !part.empty()) {
            std::size_t idx = 0;
            auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), idx);
            if (ec == std::errc{} && ptr == part.data() + part.size()) {
                frag.index = idx;
            }
        }
        frags.push_back(std::move(frag));
    }
    return ValuePath{std::move(frags)};
}

std::error_code ValuePath::get_value(const Document& doc, Value& out) const {
    if (fragments_.empty()) {
        return make_error_code(errc::field_not_found);
    }

    Value current;
    if (auto ec = doc.get_by_field(fragments_.front().field, current)) {
        return ec;
    }

    for (std::size_t i = 1; i < fragments_.size(); ++i) {
        const auto& frag = fragments_[i];
        if (current.type() == ValueType::Document) {
            Value next;
            if (auto ec = current.as_document().get_by_field(frag.field, next)) {
                return ec;
            }
            current = std::move(next);
        } else if (current.type() == ValueType::Array && frag.index &&
                   *frag.index < current.as_array().size()) {
            Value next = current.as_array()[*frag.index];
            current = std::move(next);
        } else {
            return make_error_code(errc::field_not_found);
        }
    }

    out = std::move(current);
    return {};
}

std::error_code ValuePath::set_value(FieldBuffer& buf, Value value) const {
    if (fragments_.empty()) {
        return make_error_code(errc::field_not_found);
    }
    return set_in_document(buf, fragments_, 0, std::move(value));
}

std::string ValuePath::to_string() const {
    std::string out;
    for (const auto& frag : fragments_) {
        if (!out.empty()) out += '.';
        out += frag.field;
    }
    return out;
}

} // namespace docdb
