#pragma once

#include "document/document.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <system_error>

namespace docdb::query {

// ── DocumentSource ───────────────────────────────────────────────────────────
//
// Pull side of a stream.  next() sets `out` to the next document, or to
// nullptr once the source is exhausted.  close() releases whatever the
// source holds (iterators, buffered documents) and is idempotent; a closed
// source reports exhaustion.

class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    [[nodiscard]] virtual std::error_code next(DocumentPtr& out) = 0;

    virtual void close() = 0;
};

// ── Stream ───────────────────────────────────────────────────────────────────
//
// Lazy, single-pass sequence of documents.  Combinators consume the stream
// they are called on and wrap its source:
//
//   uint64_t n = 0;
//   auto ec = std::move(s).filter(pred).offset(10).limit(5).count(n);
//
// A stream is consumed once: a terminal operation, or a combinator, on a
// stream that was already consumed throws std::logic_error.  The source is
// closed on every exit path (exhaustion, error, limit reached, destruction).

class Stream {
public:
    using Predicate = std::function<std::error_code(const Document& doc, bool& keep)>;
    using Mapper    = std::function<std::error_code(const DocumentPtr& in, DocumentPtr& out)>;
    using Visitor   = std::function<std::error_code(const DocumentPtr& doc)>;

    // An empty stream.
    Stream() = default;

    explicit Stream(std::unique_ptr<DocumentSource> source);

    ~Stream();

    Stream(Stream&& other) noexcept;
    Stream& operator=(Stream&& other) noexcept;

    Stream(const Stream&)            = delete;
    Stream& operator=(const Stream&) = delete;

    // Documents for which `pred` sets keep = true.  Predicate errors abort.
    [[nodiscard]] Stream filter(Predicate pred) &&;

    // Replaces each document by the output of `fn`.  Errors abort.
    [[nodiscard]] Stream map(Mapper fn) &&;

    // Skips the first `n` documents.
    [[nodiscard]] Stream offset(uint64_t n) &&;

    // Stops after `n` documents and closes the wrapped source right away.
    [[nodiscard]] Stream limit(uint64_t n) &&;

    // Buffers the remaining documents and yields them ordered by the value at
    // `path`, missing values first, ties kept in stream order.
    [[nodiscard]] Stream sort(ValuePath path, bool descending = false) &&;

    // Terminal: number of documents, none retained.
    [[nodiscard]] std::error_code count(uint64_t& out);

    // Terminal: calls `fn` per document, stops at the first error.
    [[nodiscard]] std::error_code iterate(const Visitor& fn);

    [[nodiscard]] bool consumed() const noexcept { return consumed_; }

private:
    // Hands the source over to a combinator or terminal operation.
    [[nodiscard]] std::unique_ptr<DocumentSource> take();

    std::unique_ptr<DocumentSource> source_;
    bool consumed_ = false;
};

} // namespace docdb::query
