#include "slotguard/slots.hpp"

namespace slotguard {
namespace slots {

StorageSlot sequential(uint64_t index) {
    return word::from_uint64(index);
}

StorageSlot reserved(std::string_view ns) {
    auto hash = crypto::Keccak256::hash(ns);
    return word::sub(hash, word::from_uint64(1));
}

StorageSlot namespaced(std::string_view ns) {
    auto inner = reserved(ns);
    auto slot = crypto::Keccak256::hash(inner.data(), inner.size());
    slot[31] = 0;
    return slot;
}

const StorageSlot& implementation() {
    static const StorageSlot slot = reserved(IMPLEMENTATION_NAMESPACE);
    return slot;
}

const StorageSlot& admin() {
    static const StorageSlot slot = reserved(ADMIN_NAMESPACE);
    return slot;
}

const StorageSlot& initializable() {
    static const StorageSlot slot = namespaced(INITIALIZABLE_NAMESPACE);
    return slot;
}

// ============================================================================
// ControlLayout
// ============================================================================

const ControlLayout& ControlLayout::standard() {
    static const ControlLayout layout{slots::implementation(), slots::admin(), slots::initializable()};
    return layout;
}

ControlLayout ControlLayout::from_namespaces(std::string_view implementation_ns,
                                             std::string_view admin_ns) {
    return ControlLayout{reserved(implementation_ns), reserved(admin_ns), slots::initializable()};
}

ControlLayout ControlLayout::naive() {
    return ControlLayout{sequential(0), sequential(1), slots::initializable()};
}

std::vector<std::pair<std::string, StorageSlot>> ControlLayout::named() const {
    return {
        {"implementation", implementation},
        {"admin", admin},
        {"initialization", initialization},
    };
}

// ============================================================================
// Disjointness
// ============================================================================

bool reachable_by_sequential(const StorageSlot& slot, uint64_t field_count) {
    auto index = word::to_uint64(slot);
    return index.has_value() && *index < field_count;
}

std::vector<SlotConflict> find_conflicts(const ControlLayout& control, uint64_t field_count) {
    std::vector<SlotConflict> conflicts;
    for (const auto& [name, slot] : control.named()) {
        if (reachable_by_sequential(slot, field_count)) {
            conflicts.push_back({name, *word::to_uint64(slot)});
        }
    }
    return conflicts;
}

} // namespace slots
} // namespace slotguard
