#pragma once

#include <optional>
#include <string>
#include <vector>
#include "slotguard/types.hpp"
#include "slotguard/slots.hpp"
#include "slotguard/storage.hpp"

namespace slotguard {
namespace layout {

enum class FieldType {
    Uint256,
    Uint64,
    Address,
    Bool,
    Gap
};

const char* type_name(FieldType type);

/**
 * @brief One declared field; a Gap reserves `slots` consecutive slots
 */
struct FieldDescriptor {
    std::string name;
    FieldType type{FieldType::Uint256};
    uint64_t slots{1};

    bool is_gap() const { return type == FieldType::Gap; }
};

FieldDescriptor field(std::string name, FieldType type);
FieldDescriptor gap(std::string name, uint64_t slots);

/**
 * @brief Ordered field list of one implementation version
 *
 * Fields take sequential slots in declaration order, one slot each, no
 * packing. A later version must keep every earlier field at its slot.
 */
class StorageLayout {
public:
    StorageLayout() = default;
    StorageLayout(std::string contract, std::vector<FieldDescriptor> fields);

    const std::string& contract() const { return contract_; }
    const std::vector<FieldDescriptor>& fields() const { return fields_; }

    std::optional<uint64_t> index_of(const std::string& name) const;
    // Throws std::out_of_range for an undeclared field
    StorageSlot slot_of(const std::string& name) const;
    const FieldDescriptor& descriptor(const std::string& name) const;

    // Sequential slots consumed, gaps included
    uint64_t footprint() const;
    bool ends_with_gap() const;

    // "V2 extends V1": this layout's fields followed by `appended`
    StorageLayout extend(std::string contract, std::vector<FieldDescriptor> appended) const;

private:
    std::string contract_;
    std::vector<FieldDescriptor> fields_;
};

/**
 * @brief Typed access to a store through a layout
 */
class StorageView {
public:
    StorageView(storage::Store& store, const StorageLayout& layout);

    Word get(const std::string& name) const;
    void set(const std::string& name, const Word& value);

    uint64_t get_uint64(const std::string& name) const;
    void set_uint64(const std::string& name, uint64_t value);
    Address get_address(const std::string& name) const;
    void set_address(const std::string& name, const Address& value);
    bool get_bool(const std::string& name) const;
    void set_bool(const std::string& name, bool value);

private:
    storage::Store& store_;
    const StorageLayout& layout_;
};

// ============================================================================
// Static layout checks
// ============================================================================

enum class Severity { Warning, Error };

enum class IssueKind {
    FieldRemoved,
    FieldMoved,
    FieldRetyped,
    FieldRenamed,
    GapMismatch,
    ControlSlotCollision
};

const char* issue_name(IssueKind kind);

struct LayoutIssue {
    Severity severity;
    IssueKind kind;
    std::string field;
    uint64_t slot_index{0};
    std::string detail;
};

struct LayoutReport {
    std::vector<LayoutIssue> issues;

    bool compatible() const;
    size_t count(Severity severity) const;
    bool has(IssueKind kind) const;
    std::string to_string() const;
};

/**
 * @brief Gap handling during upgrade checks
 *
 * Convention: a footprint change behind a trailing gap is a warning.
 * Strict: the same change is an error.
 */
enum class GapPolicy { Convention, Strict };

LayoutReport check_upgrade(const StorageLayout& from, const StorageLayout& to,
                           GapPolicy gap_policy = GapPolicy::Convention);

LayoutReport check_control_disjoint(const StorageLayout& layout,
                                    const slots::ControlLayout& control);

} // namespace layout
} // namespace slotguard
