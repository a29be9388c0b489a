#pragma once

#include <memory>
#include <optional>
#include "slotguard/config.hpp"
#include "slotguard/execution.hpp"
#include "slotguard/layout.hpp"
#include "slotguard/proxy.hpp"

namespace slotguard {

/**
 * @brief Boundary used by deployment and tooling code
 *
 * Orchestrates the components:
 * - Host (instances, delegated execution, rollback)
 * - Proxies (control slots, forwarding, upgrade authority)
 * - Layout validation before upgrades
 */
class Runtime {
public:
    explicit Runtime(RuntimeConfig config = {});

    const RuntimeConfig& config() const { return config_; }
    execution::Host& host() { return host_; }
    const execution::Host& host() const { return host_; }

    ExecutionResult deploy_implementation(const Address& deployer,
                                          std::shared_ptr<execution::ContractCode> code);

    // Deploy: new proxy over `implementation`, running `init_data` atomically
    ExecutionResult deploy_proxy(const Address& deployer, const Address& implementation,
                                 const Bytes& init_data,
                                 proxy::ProxyKind kind = proxy::ProxyKind::Erc1967);
    ExecutionResult deploy_proxy(const Address& deployer, const Address& implementation,
                                 const Bytes& init_data, const proxy::ProxyOptions& options);

    // Call
    ExecutionResult call(const Address& from, const Address& instance, const Bytes& data);

    // Upgrade: sends upgradeToAndCall to the proxy
    ExecutionResult upgrade(const Address& from, const Address& proxy_addr,
                            const Address& new_implementation, const Bytes& data);

    // Introspect
    std::optional<proxy::ProxyRecord> introspect(const Address& proxy_addr) const;

    // Static checks for repointing `proxy` at `new_implementation`
    layout::LayoutReport validate_upgrade(const Address& proxy_addr,
                                          const Address& new_implementation) const;

    proxy::ProxyOptions default_proxy_options(proxy::ProxyKind kind) const;

private:
    std::optional<layout::StorageLayout> layout_at(const Address& addr) const;

    RuntimeConfig config_;
    execution::Host host_;
};

} // namespace slotguard
