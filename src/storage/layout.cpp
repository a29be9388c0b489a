#include "slotguard/layout.hpp"
#include <map>
#include <sstream>
#include <stdexcept>

namespace slotguard {
namespace layout {

const char* type_name(FieldType type) {
    switch (type) {
        case FieldType::Uint256: return "uint256";
        case FieldType::Uint64: return "uint64";
        case FieldType::Address: return "address";
        case FieldType::Bool: return "bool";
        case FieldType::Gap: return "gap";
    }
    return "unknown";
}

FieldDescriptor field(std::string name, FieldType type) {
    return FieldDescriptor{std::move(name), type, 1};
}

FieldDescriptor gap(std::string name, uint64_t slots) {
    return FieldDescriptor{std::move(name), FieldType::Gap, slots};
}

// ============================================================================
// StorageLayout
// ============================================================================

StorageLayout::StorageLayout(std::string contract, std::vector<FieldDescriptor> fields)
    : contract_(std::move(contract)), fields_(std::move(fields)) {}

std::optional<uint64_t> StorageLayout::index_of(const std::string& name) const {
    uint64_t index = 0;
    for (const auto& f : fields_) {
        if (f.name == name && !f.is_gap()) {
            return index;
        }
        index += f.is_gap() ? f.slots : 1;
    }
    return std::nullopt;
}

StorageSlot StorageLayout::slot_of(const std::string& name) const {
    auto index = index_of(name);
    if (!index) {
        throw std::out_of_range(contract_ + " declares no field '" + name + "'");
    }
    return slots::sequential(*index);
}

const FieldDescriptor& StorageLayout::descriptor(const std::string& name) const {
    for (const auto& f : fields_) {
        if (f.name == name && !f.is_gap()) return f;
    }
    throw std::out_of_range(contract_ + " declares no field '" + name + "'");
}

uint64_t StorageLayout::footprint() const {
    uint64_t total = 0;
    for (const auto& f : fields_) {
        total += f.is_gap() ? f.slots : 1;
    }
    return total;
}

bool StorageLayout::ends_with_gap() const {
    return !fields_.empty() && fields_.back().is_gap();
}

StorageLayout StorageLayout::extend(std::string contract,
                                    std::vector<FieldDescriptor> appended) const {
    auto fields = fields_;
    fields.insert(fields.end(), appended.begin(), appended.end());
    return StorageLayout(std::move(contract), std::move(fields));
}

// ============================================================================
// StorageView
// ============================================================================

StorageView::StorageView(storage::Store& store, const StorageLayout& layout)
    : store_(store), layout_(layout) {}

Word StorageView::get(const std::string& name) const {
    return store_.read(layout_.slot_of(name));
}

void StorageView::set(const std::string& name, const Word& value) {
    store_.write(layout_.slot_of(name), value);
}

uint64_t StorageView::get_uint64(const std::string& name) const {
    return word::low64(get(name));
}

void StorageView::set_uint64(const std::string& name, uint64_t value) {
    set(name, word::from_uint64(value));
}

Address StorageView::get_address(const std::string& name) const {
    return Address::from_word(get(name));
}

void StorageView::set_address(const std::string& name, const Address& value) {
    set(name, value.to_word());
}

bool StorageView::get_bool(const std::string& name) const {
    return !word::is_zero(get(name));
}

void StorageView::set_bool(const std::string& name, bool value) {
    set_uint64(name, value ? 1 : 0);
}

// ============================================================================
// Reports
// ============================================================================

const char* issue_name(IssueKind kind) {
    switch (kind) {
        case IssueKind::FieldRemoved: return "FieldRemoved";
        case IssueKind::FieldMoved: return "FieldMoved";
        case IssueKind::FieldRetyped: return "FieldRetyped";
        case IssueKind::FieldRenamed: return "FieldRenamed";
        case IssueKind::GapMismatch: return "GapMismatch";
        case IssueKind::ControlSlotCollision: return "ControlSlotCollision";
    }
    return "Unknown";
}

bool LayoutReport::compatible() const {
    return count(Severity::Error) == 0;
}

size_t LayoutReport::count(Severity severity) const {
    size_t n = 0;
    for (const auto& issue : issues) {
        if (issue.severity == severity) ++n;
    }
    return n;
}

bool LayoutReport::has(IssueKind kind) const {
    for (const auto& issue : issues) {
        if (issue.kind == kind) return true;
    }
    return false;
}

std::string LayoutReport::to_string() const {
    std::stringstream ss;
    for (const auto& issue : issues) {
        ss << (issue.severity == Severity::Error ? "error" : "warning")
           << " " << issue_name(issue.kind)
           << " slot " << issue.slot_index
           << " '" << issue.field << "': " << issue.detail << "\n";
    }
    return ss.str();
}

// ============================================================================
// Checks
// ============================================================================

namespace {

// Slot index -> non-gap field occupying it
std::map<uint64_t, const FieldDescriptor*> field_slots(const StorageLayout& layout) {
    std::map<uint64_t, const FieldDescriptor*> out;
    uint64_t index = 0;
    for (const auto& f : layout.fields()) {
        if (f.is_gap()) {
            index += f.slots;
            continue;
        }
        out[index] = &f;
        ++index;
    }
    return out;
}

// Field (or gap) name covering `index`, empty when past the footprint
std::string field_covering(const StorageLayout& layout, uint64_t index) {
    uint64_t start = 0;
    for (const auto& f : layout.fields()) {
        uint64_t width = f.is_gap() ? f.slots : 1;
        if (index >= start && index < start + width) return f.name;
        start += width;
    }
    return {};
}

} // namespace

LayoutReport check_upgrade(const StorageLayout& from, const StorageLayout& to,
                           GapPolicy gap_policy) {
    LayoutReport report;
    auto old_slots = field_slots(from);
    auto new_slots = field_slots(to);

    for (const auto& [index, old_field] : old_slots) {
        auto it = new_slots.find(index);

        if (it == new_slots.end()) {
            auto moved_to = to.index_of(old_field->name);
            if (moved_to) {
                report.issues.push_back({Severity::Error, IssueKind::FieldMoved, old_field->name, index,
                    "moved to slot " + std::to_string(*moved_to) + " in " + to.contract()});
            } else {
                report.issues.push_back({Severity::Error, IssueKind::FieldRemoved, old_field->name, index,
                    "no field at this slot in " + to.contract()});
            }
            continue;
        }

        const auto* new_field = it->second;
        if (new_field->type != old_field->type) {
            report.issues.push_back({Severity::Error, IssueKind::FieldRetyped, old_field->name, index,
                std::string(type_name(old_field->type)) + " became " + type_name(new_field->type) +
                " '" + new_field->name + "'"});
        } else if (new_field->name != old_field->name) {
            report.issues.push_back({Severity::Warning, IssueKind::FieldRenamed, old_field->name, index,
                "renamed to '" + new_field->name + "'"});
        }
    }

    if (from.ends_with_gap() && to.footprint() != from.footprint()) {
        auto severity = gap_policy == GapPolicy::Strict ? Severity::Error : Severity::Warning;
        report.issues.push_back({severity, IssueKind::GapMismatch, from.fields().back().name,
            from.footprint(),
            "footprint " + std::to_string(from.footprint()) + " became " +
            std::to_string(to.footprint())});
    }

    return report;
}

LayoutReport check_control_disjoint(const StorageLayout& layout,
                                    const slots::ControlLayout& control) {
    LayoutReport report;
    for (const auto& conflict : slots::find_conflicts(control, layout.footprint())) {
        report.issues.push_back({Severity::Error, IssueKind::ControlSlotCollision,
            field_covering(layout, conflict.index), conflict.index,
            "shares a slot with the proxy " + conflict.control + " record"});
    }
    return report;
}

} // namespace layout
} // namespace slotguard
