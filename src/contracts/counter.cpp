#include "slotguard/counter.hpp"

namespace slotguard {
namespace contracts {

using execution::CallContext;
using execution::InitializationGuard;
using layout::FieldType;

static ExecutionResult ok_word(const Word& value) {
    return ExecutionResult::ok(abi::encode_word(value));
}

static ExecutionResult bad_args(const std::string& method) {
    return ExecutionResult::fail(Error::InvalidArguments, "bad arguments for " + method);
}

// ============================================================================
// CounterV1
// ============================================================================

const layout::StorageLayout& CounterV1::storage_layout() {
    static const layout::StorageLayout layout("CounterV1", {
        layout::field("owner", FieldType::Address),
        layout::field("value", FieldType::Uint256),
    });
    return layout;
}

CounterV1::CounterV1(CounterOptions options)
    : CounterV1("CounterV1", storage_layout(), options) {}

CounterV1::CounterV1(std::string name, layout::StorageLayout layout, CounterOptions options)
    : Contract(std::move(name), std::move(layout)), options_(options) {
    register_methods();
    enable_uups(std::make_shared<proxy::OwnerFieldPolicy>(this->layout(), "owner"));
}

ExecutionResult CounterV1::on_construct(CallContext& ctx, const Bytes& /*args*/) {
    if (!options_.lock_on_construct) {
        return ExecutionResult::ok();
    }
    return InitializationGuard(ctx).lock();
}

void CounterV1::register_methods() {
    register_method("initialize(address)", [this](CallContext& ctx, const abi::Decoder& args) {
        auto owner = args.address(0);
        if (!owner || owner->is_zero()) return bad_args("initialize");

        return InitializationGuard(ctx).initializer([&] {
            auto fields = view(ctx);
            fields.set_address("owner", *owner);
            fields.set("value", Word{});
            return ExecutionResult::ok();
        });
    });

    register_method("setValue(uint256)", [this](CallContext& ctx, const abi::Decoder& args) {
        auto value = args.word(0);
        if (!value) return bad_args("setValue");
        view(ctx).set("value", *value);
        return ExecutionResult::ok();
    });

    register_method("increment()", [this](CallContext& ctx, const abi::Decoder&) {
        auto fields = view(ctx);
        fields.set("value", word::add(fields.get("value"), word::from_uint64(1)));
        return ExecutionResult::ok();
    });

    register_method("getValue()", [this](CallContext& ctx, const abi::Decoder&) {
        return ok_word(view(ctx).get("value"));
    });

    register_method("owner()", [this](CallContext& ctx, const abi::Decoder&) {
        return ok_word(view(ctx).get("owner"));
    });

    register_method("version()", [](CallContext&, const abi::Decoder&) {
        return ok_word(word::from_uint64(1));
    });
}

// ============================================================================
// CounterV2
// ============================================================================

const layout::StorageLayout& CounterV2::storage_layout() {
    static const layout::StorageLayout layout = CounterV1::storage_layout().extend("CounterV2", {
        layout::field("newVar", FieldType::Uint256),
    });
    return layout;
}

CounterV2::CounterV2(CounterOptions options)
    : CounterV1("CounterV2", storage_layout(), options) {
    register_methods();
}

void CounterV2::register_methods() {
    register_method("reinitialize(uint64,uint256)", [this](CallContext& ctx, const abi::Decoder& args) {
        auto epoch = args.uint64(0);
        auto new_var = args.word(1);
        if (!epoch || !new_var) return bad_args("reinitialize");

        return InitializationGuard(ctx).reinitializer(*epoch, [&] {
            view(ctx).set("newVar", *new_var);
            return ExecutionResult::ok();
        });
    });

    register_method("getNewVar()", [this](CallContext& ctx, const abi::Decoder&) {
        return ok_word(view(ctx).get("newVar"));
    });

    register_method("getTotal()", [this](CallContext& ctx, const abi::Decoder&) {
        auto fields = view(ctx);
        return ok_word(word::add(fields.get("value"), fields.get("newVar")));
    });

    register_method("version()", [](CallContext&, const abi::Decoder&) {
        return ok_word(word::from_uint64(2));
    });
}

// ============================================================================
// SlotZeroStore
// ============================================================================

const layout::StorageLayout& SlotZeroStore::storage_layout() {
    static const layout::StorageLayout layout("SlotZeroStore", {
        layout::field("data", FieldType::Uint256),
    });
    return layout;
}

SlotZeroStore::SlotZeroStore() : Contract("SlotZeroStore", storage_layout()) {
    register_method("setData(uint256)", [this](CallContext& ctx, const abi::Decoder& args) {
        auto value = args.word(0);
        if (!value) return bad_args("setData");
        view(ctx).set("data", *value);
        return ExecutionResult::ok();
    });

    register_method("getData()", [this](CallContext& ctx, const abi::Decoder&) {
        return ok_word(view(ctx).get("data"));
    });
}

} // namespace contracts
} // namespace slotguard
