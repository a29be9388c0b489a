#pragma once

#include <optional>
#include <string>
#include "slotguard/execution.hpp"
#include "slotguard/slots.hpp"
#include "slotguard/upgrade.hpp"

namespace slotguard {
namespace proxy {

enum class ProxyKind {
    // No methods of its own; upgrades go through the implementation (UUPS)
    Erc1967,
    // Upgrade methods on the proxy, reachable by the admin only
    Transparent
};

struct ProxyOptions {
    ProxyKind kind{ProxyKind::Transparent};
    slots::ControlLayout control{slots::ControlLayout::standard()};
    // Defaults to the deployer
    std::optional<Address> admin;
};

/**
 * @brief Reserved-slot contents of a proxy
 */
struct ProxyRecord {
    Address implementation;
    Address admin;
};

/**
 * @brief Proxy code: holds control data, forwards everything else
 *
 * Constructor arguments: (address implementation, bytes init_data).
 * Unmatched calls are delegated to the implementation read from the
 * implementation control slot, against this proxy's store.
 */
class ProxyCode : public execution::ContractCode {
public:
    explicit ProxyCode(ProxyOptions options = {});

    const std::string& name() const override { return name_; }
    ExecutionResult construct(execution::CallContext& ctx, const Bytes& args) override;
    ExecutionResult execute(execution::CallContext& ctx) override;

    ProxyRecord record(const storage::Store& store) const;
    const ProxyOptions& options() const { return options_; }

private:
    ExecutionResult forward(execution::CallContext& ctx);
    ExecutionResult admin_call(execution::CallContext& ctx);
    void set_admin(execution::CallContext& ctx, const Address& admin);

    ProxyOptions options_;
    std::string name_;
    AdminPolicy admin_policy_;
};

Bytes constructor_args(const Address& implementation, const Bytes& init_data);

// nullopt when `proxy` is not running ProxyCode
std::optional<ProxyRecord> introspect(const execution::Host& host, const Address& proxy);

} // namespace proxy
} // namespace slotguard
