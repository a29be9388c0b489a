#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "slotguard/types.hpp"

namespace slotguard {
namespace slots {

// Ordinary field slot: declaration index
StorageSlot sequential(uint64_t index);

// keccak256(ns) - 1
StorageSlot reserved(std::string_view ns);

// keccak256(uint256(keccak256(ns)) - 1) with the low byte cleared
StorageSlot namespaced(std::string_view ns);

constexpr const char* IMPLEMENTATION_NAMESPACE = "eip1967.proxy.implementation";
constexpr const char* ADMIN_NAMESPACE = "eip1967.proxy.admin";
constexpr const char* INITIALIZABLE_NAMESPACE = "openzeppelin.storage.Initializable";

// Computed once per process
const StorageSlot& implementation();
const StorageSlot& admin();
const StorageSlot& initializable();

/**
 * @brief Where a proxy keeps its control data
 *
 * standard() keeps all three records in hash-derived slots. naive() puts
 * the implementation and admin pointers at sequential slots 0 and 1, where
 * the first fields of any implementation also live.
 */
struct ControlLayout {
    StorageSlot implementation{};
    StorageSlot admin{};
    StorageSlot initialization{};

    static const ControlLayout& standard();
    static ControlLayout from_namespaces(std::string_view implementation_ns,
                                         std::string_view admin_ns);
    static ControlLayout naive();

    std::vector<std::pair<std::string, StorageSlot>> named() const;
};

// True when some declaration index below field_count equals slot
bool reachable_by_sequential(const StorageSlot& slot, uint64_t field_count);

struct SlotConflict {
    std::string control;  // "implementation", "admin" or "initialization"
    uint64_t index;       // sequential index that collides
};

std::vector<SlotConflict> find_conflicts(const ControlLayout& control, uint64_t field_count);

} // namespace slots
} // namespace slotguard
