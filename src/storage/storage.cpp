#include "slotguard/storage.hpp"

namespace slotguard {
namespace storage {

// ============================================================================
// Store Implementation
// ============================================================================

Store::Store(Journal* journal, const Address& owner)
    : journal_(journal), owner_(owner) {}

Word Store::read(const StorageSlot& slot) const {
    auto it = data_.find(slot);
    if (it == data_.end()) {
        return Word{};
    }
    return it->second;
}

void Store::write(const StorageSlot& slot, const Word& value) {
    auto it = data_.find(slot);

    // Record for journal (revert support)
    if (journal_) {
        std::optional<Word> previous;
        if (it != data_.end()) {
            previous = it->second;
        }
        journal_->record_write(this, slot, previous);
    }

    if (word::is_zero(value)) {
        if (it != data_.end()) data_.erase(it);
    } else if (it != data_.end()) {
        it->second = value;
    } else {
        data_.emplace(slot, value);
    }
}

bool Store::contains(const StorageSlot& slot) const {
    return data_.find(slot) != data_.end();
}

void Store::restore(const StorageSlot& slot, const std::optional<Word>& previous) {
    if (previous.has_value()) {
        data_[slot] = *previous;
    } else {
        data_.erase(slot);
    }
}

// ============================================================================
// Journal Implementation
// ============================================================================

void Journal::record_write(Store* store, const StorageSlot& slot,
                           const std::optional<Word>& previous) {
    JournalEntry entry;
    entry.kind = JournalEntry::Kind::StorageWrite;
    entry.store = store;
    entry.slot = slot;
    entry.previous = previous;
    entries_.push_back(entry);
}

void Journal::record_create(const Address& addr) {
    JournalEntry entry;
    entry.kind = JournalEntry::Kind::Create;
    entry.created = addr;
    entries_.push_back(entry);
}

std::vector<Address> Journal::revert(size_t mark) {
    std::vector<Address> created;

    // Revert journal entries back to snapshot point
    while (entries_.size() > mark) {
        auto& entry = entries_.back();

        if (entry.kind == JournalEntry::Kind::StorageWrite) {
            entry.store->restore(entry.slot, entry.previous);
        } else {
            created.push_back(entry.created);
        }

        entries_.pop_back();
    }

    return created;
}

} // namespace storage
} // namespace slotguard
