#pragma once

#include "storage/engine.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace docdb::storage {

// ── MemoryEngine ─────────────────────────────────────────────────────────────
//
// Transactional in-memory backend.
//
// Concurrency model:
//   - The committed state is an immutable map of store name → entries.
//     begin() pins it under a short lock; read-only transactions keep reading
//     that version no matter what is committed afterwards.
//   - One writable transaction at a time: begin(writable=true) holds the
//     writer mutex until commit/rollback.  A writer clones a store the first
//     time it mutates it (copy-on-write) and publishes a new state on commit.

class MemoryEngine final : public Engine {
public:
    struct StoreData {
        std::map<std::string, std::string, std::less<>> entries;
    };

    struct State {
        std::map<std::string, std::shared_ptr<StoreData>, std::less<>> stores;
        // Survives truncate and drop so sequences never repeat.
        std::map<std::string, uint64_t, std::less<>> sequences;
    };

    MemoryEngine();

    // Not copyable or movable – transactions keep a reference to the engine.
    MemoryEngine(const MemoryEngine&)            = delete;
    MemoryEngine& operator=(const MemoryEngine&) = delete;
    MemoryEngine(MemoryEngine&&)                 = delete;
    MemoryEngine& operator=(MemoryEngine&&)      = delete;

    [[nodiscard]] std::error_code begin(const CancellationToken& token,
                                        bool writable,
                                        std::unique_ptr<Transaction>& out) override;

    [[nodiscard]] const char* name() const noexcept override { return "memory"; }

private:
    friend class MemoryTransaction;

    [[nodiscard]] std::shared_ptr<const State> committed() const;
    void publish(std::shared_ptr<const State> state);

    mutable std::mutex state_mutex_;
    std::shared_ptr<const State> committed_;
    std::mutex writer_mutex_;
};

} // namespace docdb::storage
