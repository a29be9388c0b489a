#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include "slotguard/abi.hpp"
#include "slotguard/execution.hpp"
#include "slotguard/initializable.hpp"
#include "slotguard/layout.hpp"
#include "slotguard/upgrade.hpp"

namespace slotguard {
namespace contracts {

using Method = std::function<ExecutionResult(execution::CallContext&, const abi::Decoder&)>;

/**
 * @brief Contract code with a declared storage layout and a method table
 *
 * Methods are keyed by ABI selector. Every field access goes through the
 * layout against ctx.store(), so the same code works standalone and behind
 * a proxy.
 */
class Contract : public execution::ContractCode {
public:
    Contract(const Contract&) = delete;
    Contract& operator=(const Contract&) = delete;

    const std::string& name() const override { return name_; }
    ExecutionResult construct(execution::CallContext& ctx, const Bytes& args) override;
    ExecutionResult execute(execution::CallContext& ctx) override;

    const layout::StorageLayout& layout() const { return layout_; }
    bool has_method(const std::string& signature) const;

protected:
    Contract(std::string name, layout::StorageLayout layout);

    // Re-registering a signature replaces the earlier handler
    void register_method(const std::string& signature, Method method);

    virtual ExecutionResult on_construct(execution::CallContext& ctx, const Bytes& args);

    layout::StorageView view(execution::CallContext& ctx) const;

    // Adds upgradeToAndCall(address,bytes) and proxiableUUID()
    void enable_uups(std::shared_ptr<proxy::UpgradePolicy> policy);

private:
    ExecutionResult uups_upgrade(execution::CallContext& ctx, const abi::Decoder& args);
    ExecutionResult proxiable_uuid(execution::CallContext& ctx);

    std::string name_;
    layout::StorageLayout layout_;
    std::map<abi::Selector, Method> methods_;
    std::shared_ptr<proxy::UpgradePolicy> upgrade_policy_;
};

} // namespace contracts
} // namespace slotguard
