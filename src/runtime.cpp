#include "slotguard/runtime.hpp"
#include "slotguard/abi.hpp"
#include "slotguard/contract.hpp"
#include "slotguard/log.hpp"

namespace slotguard {

Runtime::Runtime(RuntimeConfig config) : config_(std::move(config)) {}

proxy::ProxyOptions Runtime::default_proxy_options(proxy::ProxyKind kind) const {
    proxy::ProxyOptions options;
    options.kind = kind;
    // UUPS implementations write the standard slot themselves
    options.control = kind == proxy::ProxyKind::Transparent
        ? config_.control_layout()
        : slots::ControlLayout::standard();
    return options;
}

ExecutionResult Runtime::deploy_implementation(const Address& deployer,
                                               std::shared_ptr<execution::ContractCode> code) {
    return host_.deploy(deployer, std::move(code));
}

ExecutionResult Runtime::deploy_proxy(const Address& deployer, const Address& implementation,
                                      const Bytes& init_data, proxy::ProxyKind kind) {
    return deploy_proxy(deployer, implementation, init_data, default_proxy_options(kind));
}

ExecutionResult Runtime::deploy_proxy(const Address& deployer, const Address& implementation,
                                      const Bytes& init_data, const proxy::ProxyOptions& options) {
    if (config_.layout_policy != LayoutPolicy::Off) {
        layout::LayoutReport report;
        for (const auto& conflict : slots::find_conflicts(options.control, config_.max_sequential_fields)) {
            report.issues.push_back({layout::Severity::Error, layout::IssueKind::ControlSlotCollision,
                conflict.control, conflict.index, "control slot is reachable by sequential allocation"});
        }
        if (auto fields = layout_at(implementation)) {
            auto disjoint = layout::check_control_disjoint(*fields, options.control);
            report.issues.insert(report.issues.end(), disjoint.issues.begin(), disjoint.issues.end());
        }

        if (!report.issues.empty()) {
            log::warn("LAYOUT", "Proxy control layout problems:\n" + report.to_string());
            if (config_.layout_policy == LayoutPolicy::Enforce) {
                return ExecutionResult::fail(Error::StorageCollision, report.to_string());
            }
        }
    }

    auto code = std::make_shared<proxy::ProxyCode>(options);
    return host_.deploy(deployer, code, proxy::constructor_args(implementation, init_data));
}

ExecutionResult Runtime::call(const Address& from, const Address& instance, const Bytes& data) {
    return host_.call(from, instance, data);
}

ExecutionResult Runtime::upgrade(const Address& from, const Address& proxy_addr,
                                 const Address& new_implementation, const Bytes& data) {
    // Check and upgrade as one step, so the check sees the implementation being replaced
    auto lock = host_.lock();

    if (config_.layout_policy != LayoutPolicy::Off) {
        auto report = validate_upgrade(proxy_addr, new_implementation);
        if (!report.issues.empty()) {
            log::warn("LAYOUT", "Upgrade of " + proxy_addr.to_hex() + ":\n" + report.to_string());
        }
        if (config_.layout_policy == LayoutPolicy::Enforce && !report.compatible()) {
            return ExecutionResult::fail(Error::StorageCollision, report.to_string());
        }
    }

    auto calldata = abi::Encoder(proxy::UPGRADE_TO_AND_CALL)
        .address(new_implementation)
        .bytes(data)
        .build();
    return host_.call(from, proxy_addr, calldata);
}

std::optional<proxy::ProxyRecord> Runtime::introspect(const Address& proxy_addr) const {
    return proxy::introspect(host_, proxy_addr);
}

layout::LayoutReport Runtime::validate_upgrade(const Address& proxy_addr,
                                               const Address& new_implementation) const {
    layout::LayoutReport report;

    auto record = introspect(proxy_addr);
    auto next = layout_at(new_implementation);
    if (!record || !next) {
        return report;
    }

    if (auto current = layout_at(record->implementation)) {
        report = layout::check_upgrade(*current, *next, config_.gap_policy);
    }

    auto proxy_code = std::dynamic_pointer_cast<proxy::ProxyCode>(host_.code_at(proxy_addr));
    if (proxy_code) {
        auto disjoint = layout::check_control_disjoint(*next, proxy_code->options().control);
        report.issues.insert(report.issues.end(), disjoint.issues.begin(), disjoint.issues.end());
    }
    return report;
}

std::optional<layout::StorageLayout> Runtime::layout_at(const Address& addr) const {
    auto contract = std::dynamic_pointer_cast<contracts::Contract>(host_.code_at(addr));
    if (!contract) {
        return std::nullopt;
    }
    return contract->layout();
}

} // namespace slotguard
