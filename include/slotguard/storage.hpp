#pragma once

#include <map>
#include <optional>
#include <vector>
#include "slotguard/types.hpp"

namespace slotguard {
namespace storage {

class Journal;

/**
 * @brief Persistent slot store of a single contract instance
 *
 * Maps slot to word. Slots never written read as zero, and writing zero
 * removes the entry. The store knows nothing about field types: two
 * fields mapped to the same slot silently share one value.
 */
class Store {
public:
    Store() = default;
    Store(Journal* journal, const Address& owner);

    Word read(const StorageSlot& slot) const;
    void write(const StorageSlot& slot, const Word& value);

    bool contains(const StorageSlot& slot) const;
    size_t size() const { return data_.size(); }
    const std::map<StorageSlot, Word>& entries() const { return data_; }
    const Address& owner() const { return owner_; }

private:
    friend class Journal;
    void restore(const StorageSlot& slot, const std::optional<Word>& previous);

    Journal* journal_{nullptr};
    Address owner_;
    std::map<StorageSlot, Word> data_;
};

/**
 * @brief Undo log for every store of one host
 *
 * Entries are undone newest-first, so writes into a freshly created
 * instance are rolled back before the creation itself.
 */
class Journal {
public:
    size_t size() const { return entries_.size(); }

    void record_write(Store* store, const StorageSlot& slot, const std::optional<Word>& previous);
    void record_create(const Address& addr);

    // Rolls back to `mark`; returns instances created after it, newest first
    std::vector<Address> revert(size_t mark);

    // Forget history; called once an external call has committed
    void clear() { entries_.clear(); }

private:
    struct JournalEntry {
        enum class Kind { StorageWrite, Create };
        Kind kind;
        Store* store{nullptr};
        StorageSlot slot{};
        std::optional<Word> previous;
        Address created;
    };
    std::vector<JournalEntry> entries_;
};

} // namespace storage
} // namespace slotguard
