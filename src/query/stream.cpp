#include "query/stream.hpp"

#include "common/error.hpp"
#include "document/key_encoding.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace docdb::query {

namespace {

class EmptySource final : public DocumentSource {
public:
    std::error_code next(DocumentPtr& out) override {
        out = nullptr;
        return {};
    }
    void close() override {}
};

// ── FilterSource ─────────────────────────────────────────────────────────────

class FilterSource final : public DocumentSource {
public:
    FilterSource(std::unique_ptr<DocumentSource> inner, Stream::Predicate pred)
        : inner_(std::move(inner))
        , pred_(std::move(pred))
    {}

    std::error_code next(DocumentPtr& out) override {
        for (;;) {
            if (auto ec = inner_->next(out)) return ec;
            if (!out) return {};

            bool keep = false;
            if (auto ec = pred_(*out, keep)) {
                out = nullptr;
                return ec;
            }
            if (keep) return {};
        }
    }

    void close() override { inner_->close(); }

private:
    std::unique_ptr<DocumentSource> inner_;
    Stream::Predicate pred_;
};

// ── MapSource ────────────────────────────────────────────────────────────────

class MapSource final : public DocumentSource {
public:
    MapSource(std::unique_ptr<DocumentSource> inner, Stream::Mapper fn)
        : inner_(std::move(inner))
        , fn_(std::move(fn))
    {}

    std::error_code next(DocumentPtr& out) override {
        DocumentPtr in;
        if (auto ec = inner_->next(in)) return ec;
        if (!in) {
            out = nullptr;
            return {};
        }
        return fn_(in, out);
    }

    void close() override { inner_->close(); }

private:
    std::unique_ptr<DocumentSource> inner_;
    Stream::Mapper fn_;
};

// ── OffsetSource ─────────────────────────────────────────────────────────────

class OffsetSource final : public DocumentSource {
public:
    OffsetSource(std::unique_ptr<DocumentSource> inner, uint64_t n)
        : inner_(std::move(inner))
        , remaining_(n)
    {}

    std::error_code next(DocumentPtr& out) override {
        while (remaining_ > 0) {
            if (auto ec = inner_->next(out)) return ec;
            if (!out) return {};
            --remaining_;
        }
        return inner_->next(out);
    }

    void close() override { inner_->close(); }

private:
    std::unique_ptr<DocumentSource> inner_;
    uint64_t remaining_;
};

// ── LimitSource ──────────────────────────────────────────────────────────────

class LimitSource final : public DocumentSource {
public:
    LimitSource(std::unique_ptr<DocumentSource> inner, uint64_t n)
        : inner_(std::move(inner))
        , remaining_(n)
    {}

    std::error_code next(DocumentPtr& out) override {
        out = nullptr;
        if (remaining_ == 0) {
            inner_->close();
            return {};
        }
        if (auto ec = inner_->next(out)) return ec;
        if (out && --remaining_ == 0) {
            inner_->close();
        }
        return {};
    }

    void close() override { inner_->close(); }

private:
    std::unique_ptr<DocumentSource> inner_;
    uint64_t remaining_;
};

// ── SortSource ───────────────────────────────────────────────────────────────
// Orders by the key encoding of the value at the path, which is the order an
// index on that path yields.  Missing values sort as null.

class SortSource final : public DocumentSource {
public:
    SortSource(std::unique_ptr<DocumentSource> inner, ValuePath path, bool descending)
        : inner_(std::move(inner))
        , path_(std::move(path))
        , descending_(descending)
    {}

    std::error_code next(DocumentPtr& out) override {
        out = nullptr;
        if (!loaded_) {
            if (auto ec = load()) {
                close();
                return ec;
            }
        }
        if (pos_ < rows_.size()) {
            out = std::move(rows_[pos_++].second);
        }
        return {};
    }

    void close() override {
        inner_->close();
        rows_.clear();
        pos_ = 0;
        loaded_ = true;
    }

private:
    std::error_code load() {
        loaded_ = true;
        for (;;) {
            DocumentPtr doc;
            if (auto ec = inner_->next(doc)) return ec;
            if (!doc) break;

            Value v;
            if (auto ec = path_.get_value(*doc, v); ec && ec != errc::field_not_found) {
                return ec;
            }
            std::string key;
            if (auto ec = keys::encode_value(v, key)) return ec;
            rows_.emplace_back(std::move(key), std::move(doc));
        }
        inner_->close();

        if (descending_) {
            std::stable_sort(rows_.begin(), rows_.end(),
                             [](const auto& a, const auto& b) { return a.first > b.first; });
        } else {
            std::stable_sort(rows_.begin(), rows_.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
        }
        return {};
    }

    std::unique_ptr<DocumentSource> inner_;
    ValuePath path_;
    bool descending_;
    bool loaded_ = false;
    std::vector<std::pair<std::string, DocumentPtr>> rows_;
    std::size_t pos_ = 0;
};

} // anonymous namespace

// ── Stream ───────────────────────────────────────────────────────────────────

Stream::Stream(std::unique_ptr<DocumentSource> source)
    : source_(std::move(source))
{}

Stream::~Stream() {
    if (source_) {
        source_->close();
    }
}

Stream::Stream(Stream&& other) noexcept
    : source_(std::move(other.source_))
    , consumed_(other.consumed_)
{
    other.consumed_ = true;
}

Stream& Stream::operator=(Stream&& other) noexcept {
    if (this != &other) {
        if (source_) {
            source_->close();
        }
        source_ = std::move(other.source_);
        consumed_ = other.consumed_;
        other.consumed_ = true;
    }
    return *this;
}

std::unique_ptr<DocumentSource> Stream::take() {
    if (consumed_) {
        throw std::logic_error("stream already consumed");
    }
    consumed_ = true;
    if (!source_) {
        return std::make_unique<EmptySource>();
    }
    return std::move(source_);
}

Stream Stream::filter(Predicate pred) && {
    return Stream(std::make_unique<FilterSource>(take(), std::move(pred)));
}

Stream Stream::map(Mapper fn) && {
    return Stream(std::make_unique<MapSource>(take(), std::move(fn)));
}

Stream Stream::offset(uint64_t n) && {
    return Stream(std::make_unique<OffsetSource>(take(), n));
}

Stream Stream::limit(uint64_t n) && {
    return Stream(std::make_unique<LimitSource>(take(), n));
}

Stream Stream::sort(ValuePath path, bool descending) && {
    return Stream(std::make_unique<SortSource>(take(), std::move(path), descending));
}

std::error_code Stream::count(uint64_t& out) {
    out = 0;
    return iterate([&out](const DocumentPtr&) -> std::error_code {
        ++out;
        return {};
    });
}

std::error_code Stream::iterate(const Visitor& fn) {
    auto source = take();

    std::error_code ec;
    for (;;) {
        DocumentPtr doc;
        if ((ec = source->next(doc))) break;
        if (!doc) break;
        if ((ec = fn(doc))) break;
    }
    source->close();
    return ec;
}

} // namespace docdb::query
