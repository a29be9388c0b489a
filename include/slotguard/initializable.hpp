#pragma once

#include <functional>
#include <limits>
#include "slotguard/execution.hpp"
#include "slotguard/slots.hpp"

namespace slotguard {
namespace execution {

enum class InitializationPhase {
    Uninitialized,
    Initialized,
    Locked
};

/**
 * @brief Decoded initialization record
 *
 * Stored in one word: epoch in the low 8 bytes, the `initializing` flag in
 * the byte above it. Locked is epoch == LOCKED_EPOCH.
 */
struct InitializationState {
    static constexpr uint64_t LOCKED_EPOCH = std::numeric_limits<uint64_t>::max();

    InitializationPhase phase{InitializationPhase::Uninitialized};
    uint64_t epoch{0};
    bool initializing{false};

    static InitializationState decode(const Word& w);
    Word encode() const;
};

/**
 * @brief One-shot / versioned initialization state machine
 *
 * Operates on whatever store the context executes against: the proxy's
 * store under delegation, the instance's own store when called directly.
 *
 *   Uninitialized --initializer-->        Initialized(1)
 *   Initialized(n) --reinitializer(n+1)--> Initialized(n+1)
 *   Uninitialized --lock-->               Locked (terminal)
 */
class InitializationGuard {
public:
    using Body = std::function<ExecutionResult()>;

    explicit InitializationGuard(CallContext& ctx,
                                 const StorageSlot& slot = slots::initializable());

    InitializationState state() const;

    ExecutionResult initializer(const Body& body);
    ExecutionResult reinitializer(uint64_t epoch, const Body& body);

    // Called from constructors of instances that must never be initialized directly
    ExecutionResult lock();

    // For setup helpers that may only run inside an initializer
    ExecutionResult only_initializing() const;

private:
    ExecutionResult run(uint64_t epoch, const Body& body);
    void store_state(const InitializationState& state);

    CallContext& ctx_;
    StorageSlot slot_;
};

// topic 0 of Initialized(uint64)
const Hash256& initialized_event();

} // namespace execution
} // namespace slotguard
