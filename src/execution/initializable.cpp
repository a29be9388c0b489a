#include "slotguard/initializable.hpp"
#include "slotguard/log.hpp"

namespace slotguard {
namespace execution {

// Byte holding the `initializing` flag, just above the 8 epoch bytes
static constexpr size_t INITIALIZING_BYTE = 23;

InitializationState InitializationState::decode(const Word& w) {
    InitializationState state;
    state.epoch = word::low64(w);
    state.initializing = w[INITIALIZING_BYTE] != 0;

    if (state.epoch == LOCKED_EPOCH) {
        state.phase = InitializationPhase::Locked;
    } else if (state.epoch > 0) {
        state.phase = InitializationPhase::Initialized;
    }
    return state;
}

Word InitializationState::encode() const {
    Word w = word::from_uint64(epoch);
    w[INITIALIZING_BYTE] = initializing ? 1 : 0;
    return w;
}

const Hash256& initialized_event() {
    static const Hash256 topic = crypto::Keccak256::hash("Initialized(uint64)");
    return topic;
}

// ============================================================================
// InitializationGuard
// ============================================================================

InitializationGuard::InitializationGuard(CallContext& ctx, const StorageSlot& slot)
    : ctx_(ctx), slot_(slot) {}

InitializationState InitializationGuard::state() const {
    return InitializationState::decode(ctx_.store().read(slot_));
}

void InitializationGuard::store_state(const InitializationState& state) {
    ctx_.store().write(slot_, state.encode());
}

ExecutionResult InitializationGuard::initializer(const Body& body) {
    auto current = state();

    if (current.phase == InitializationPhase::Locked) {
        return ExecutionResult::fail(Error::InitializerDisabled,
                                     "initializers are disabled on " + ctx_.self().to_hex());
    }
    if (current.phase == InitializationPhase::Initialized || current.initializing) {
        return ExecutionResult::fail(Error::AlreadyInitialized,
                                     "already initialized at epoch " + std::to_string(current.epoch));
    }

    return run(1, body);
}

ExecutionResult InitializationGuard::reinitializer(uint64_t epoch, const Body& body) {
    auto current = state();

    if (current.phase == InitializationPhase::Locked) {
        return ExecutionResult::fail(Error::InitializerDisabled,
                                     "initializers are disabled on " + ctx_.self().to_hex());
    }
    if (current.initializing) {
        return ExecutionResult::fail(Error::AlreadyInitialized, "initializer already running");
    }
    if (epoch != current.epoch + 1 || epoch == InitializationState::LOCKED_EPOCH) {
        return ExecutionResult::fail(Error::InvalidReinitializationEpoch,
                                     "expected epoch " + std::to_string(current.epoch + 1) +
                                     ", got " + std::to_string(epoch));
    }

    return run(epoch, body);
}

ExecutionResult InitializationGuard::run(uint64_t epoch, const Body& body) {
    InitializationState next;
    next.phase = InitializationPhase::Initialized;
    next.epoch = epoch;
    next.initializing = true;
    store_state(next);

    auto result = body();
    if (!result.success) {
        // Caller's snapshot undoes the epoch write
        return result;
    }

    next.initializing = false;
    store_state(next);
    auto data = word::from_uint64(epoch);
    ctx_.emit({initialized_event()}, Bytes(data.begin(), data.end()));

    log::debug("GUARD", ctx_.self().to_hex() + " initialized at epoch " + std::to_string(epoch));
    return result;
}

ExecutionResult InitializationGuard::lock() {
    auto current = state();

    if (current.phase == InitializationPhase::Locked) {
        return ExecutionResult::ok();
    }
    if (current.phase == InitializationPhase::Initialized || current.initializing) {
        return ExecutionResult::fail(Error::AlreadyInitialized,
                                     "cannot lock an initialized instance");
    }

    InitializationState locked;
    locked.phase = InitializationPhase::Locked;
    locked.epoch = InitializationState::LOCKED_EPOCH;
    store_state(locked);

    auto data = word::from_uint64(InitializationState::LOCKED_EPOCH);
    ctx_.emit({initialized_event()}, Bytes(data.begin(), data.end()));
    return ExecutionResult::ok();
}

ExecutionResult InitializationGuard::only_initializing() const {
    if (!state().initializing) {
        return ExecutionResult::fail(Error::NotInitializing, "not inside an initializer");
    }
    return ExecutionResult::ok();
}

} // namespace execution
} // namespace slotguard
