#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "slotguard/types.hpp"
#include "slotguard/storage.hpp"

namespace slotguard {
namespace execution {

class Host;

/**
 * @brief Message being executed
 *
 * `recipient` is the instance whose storage the code runs against;
 * `code_address` is the instance whose code runs. They differ only for
 * delegated execution.
 */
struct Message {
    Address sender;
    Address recipient;
    Address code_address;
    Bytes data;
    bool delegated{false};
};

/**
 * @brief Everything a piece of contract code may touch while it runs
 *
 * The store is held by reference: under delegation it is the caller's
 * store, never the store of the instance that owns the code.
 */
class CallContext {
public:
    CallContext(Host& host, storage::Store& store, Message msg, bool constructing);

    Host& host() { return host_; }
    storage::Store& store() { return store_; }
    const storage::Store& store() const { return store_; }

    const Address& self() const { return msg_.recipient; }
    const Address& caller() const { return msg_.sender; }
    const Address& code_address() const { return msg_.code_address; }
    const Bytes& data() const { return msg_.data; }
    bool delegated() const { return msg_.delegated; }
    bool constructing() const { return constructing_; }

    void emit(std::vector<Hash256> topics, Bytes data = {});

    // Runs `target`'s code against this context's store
    ExecutionResult delegate_call(const Address& target, const Bytes& data);
    // Runs `target`'s code against `target`'s own store
    ExecutionResult call(const Address& target, const Bytes& data);

    bool has_code(const Address& target) const;

private:
    Host& host_;
    storage::Store& store_;
    Message msg_;
    bool constructing_;
};

/**
 * @brief Executable logic of a contract instance
 */
class ContractCode {
public:
    virtual ~ContractCode() = default;

    virtual const std::string& name() const = 0;

    // Runs once when an instance with this code is deployed
    virtual ExecutionResult construct(CallContext& ctx, const Bytes& args) = 0;

    // Handles one call; ctx.data() is the calldata
    virtual ExecutionResult execute(CallContext& ctx) = 0;
};

/**
 * @brief Set of contract instances and the calls between them
 *
 * Every external entry point runs to completion under one lock and either
 * commits all of its writes or none of them. The lock is recursive so a
 * caller holding lock() can chain several entry points into one step.
 */
class Host {
public:
    Host() = default;
    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    // Create an instance running `code`, constructed with `args`
    ExecutionResult deploy(const Address& deployer, std::shared_ptr<ContractCode> code,
                           const Bytes& args = {});

    // External call
    ExecutionResult call(const Address& from, const Address& to, const Bytes& data);

    // Holds out every other thread's entry points until released
    std::unique_lock<std::recursive_mutex> lock() const;

    // Inspection (never gated)
    bool has_code(const Address& addr) const;
    std::shared_ptr<ContractCode> code_at(const Address& addr) const;
    // The pointer may only be read while lock() is held
    const storage::Store* store_of(const Address& addr) const;
    Word read_storage(const Address& addr, const StorageSlot& slot) const;
    size_t instance_count() const;

private:
    friend class CallContext;

    struct Account {
        std::shared_ptr<ContractCode> code;
        storage::Store store;
    };

    // Snapshot for revert on failed call
    struct Snapshot {
        size_t journal_size;
        size_t log_count;
    };
    Snapshot snapshot() const;
    void revert(const Snapshot& snap);
    std::vector<Log> take_logs(const Snapshot& snap);

    Account* find(const Address& addr);
    const Account* find(const Address& addr) const;
    Address next_address(const Address& deployer);

    ExecutionResult delegate_call(CallContext& parent, const Address& target, const Bytes& data);
    ExecutionResult nested_call(CallContext& parent, const Address& target, const Bytes& data);

    mutable std::recursive_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Account>> accounts_;
    std::unordered_map<std::string, uint64_t> nonces_;
    storage::Journal journal_;
    std::vector<Log> logs_;
};

} // namespace execution
} // namespace slotguard
