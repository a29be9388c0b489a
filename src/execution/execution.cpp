#include "slotguard/execution.hpp"
#include "slotguard/log.hpp"
#include <exception>
#include <iterator>

namespace slotguard {
namespace execution {

// Contract code that throws fails its frame like any other error
template <typename Fn>
static ExecutionResult run_guarded(const std::string& name, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return ExecutionResult::fail(Error::Reverted, name + " threw: " + e.what());
    }
}

// ============================================================================
// CallContext
// ============================================================================

CallContext::CallContext(Host& host, storage::Store& store, Message msg, bool constructing)
    : host_(host), store_(store), msg_(std::move(msg)), constructing_(constructing) {}

void CallContext::emit(std::vector<Hash256> topics, Bytes data) {
    host_.logs_.push_back(Log{self(), std::move(topics), std::move(data)});
}

ExecutionResult CallContext::delegate_call(const Address& target, const Bytes& data) {
    return host_.delegate_call(*this, target, data);
}

ExecutionResult CallContext::call(const Address& target, const Bytes& data) {
    return host_.nested_call(*this, target, data);
}

bool CallContext::has_code(const Address& target) const {
    const auto* account = host_.find(target);
    return account && account->code;
}

// ============================================================================
// Host Implementation
// ============================================================================

ExecutionResult Host::deploy(const Address& deployer, std::shared_ptr<ContractCode> code,
                             const Bytes& args) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!code) {
        return ExecutionResult::fail(Error::NoCode, "deployment without code");
    }

    Address addr = next_address(deployer);
    auto snap = snapshot();

    journal_.record_create(addr);
    auto account = std::make_unique<Account>();
    account->code = code;
    account->store = storage::Store(&journal_, addr);
    Account& created = *account;
    accounts_[addr.to_hex()] = std::move(account);

    // Execute constructor
    CallContext ctx(*this, created.store, Message{deployer, addr, addr, args, false}, true);
    auto result = run_guarded(code->name(), [&] { return code->construct(ctx, args); });

    if (!result.success) {
        revert(snap);
        log::debug("HOST", "Deployment of " + code->name() + " failed: " +
                   error_name(result.error) + " " + result.message);
        return result;
    }

    result.created_address = addr;
    result.logs = take_logs(snap);
    journal_.clear();

    log::debug("HOST", "Deployed " + code->name() + " at " + addr.to_hex());
    return result;
}

ExecutionResult Host::call(const Address& from, const Address& to, const Bytes& data) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Account* account = find(to);
    if (!account || !account->code) {
        return ExecutionResult::fail(Error::NoCode, "no contract at " + to.to_hex());
    }

    auto code = account->code;
    auto snap = snapshot();

    CallContext ctx(*this, account->store, Message{from, to, to, data, false}, false);
    auto result = run_guarded(code->name(), [&] { return code->execute(ctx); });

    if (!result.success) {
        revert(snap);
        log::debug("HOST", "Call to " + to.to_hex() + " reverted: " +
                   error_name(result.error) + " " + result.message);
        return result;
    }

    result.logs = take_logs(snap);
    journal_.clear();
    return result;
}

ExecutionResult Host::delegate_call(CallContext& parent, const Address& target, const Bytes& data) {
    const Account* account = find(target);
    if (!account || !account->code) {
        return ExecutionResult::fail(Error::InvalidImplementation,
                                     target.to_hex() + " has no executable code");
    }

    auto code = account->code;
    auto snap = snapshot();

    // Callee code, caller storage
    CallContext child(*this, parent.store(),
                      Message{parent.caller(), parent.self(), target, data, true}, false);
    auto result = run_guarded(code->name(), [&] { return code->execute(child); });

    if (!result.success) {
        revert(snap);
    }
    return result;
}

ExecutionResult Host::nested_call(CallContext& parent, const Address& target, const Bytes& data) {
    Account* account = find(target);
    if (!account || !account->code) {
        return ExecutionResult::fail(Error::NoCode, "no contract at " + target.to_hex());
    }

    auto code = account->code;
    auto snap = snapshot();

    CallContext child(*this, account->store,
                      Message{parent.self(), target, target, data, false}, false);
    auto result = run_guarded(code->name(), [&] { return code->execute(child); });

    if (!result.success) {
        revert(snap);
    }
    return result;
}

bool Host::has_code(const Address& addr) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Account* account = find(addr);
    return account && account->code;
}

std::shared_ptr<ContractCode> Host::code_at(const Address& addr) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Account* account = find(addr);
    return account ? account->code : nullptr;
}

const storage::Store* Host::store_of(const Address& addr) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Account* account = find(addr);
    return account ? &account->store : nullptr;
}

Word Host::read_storage(const Address& addr, const StorageSlot& slot) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Account* account = find(addr);
    return account ? account->store.read(slot) : Word{};
}

std::unique_lock<std::recursive_mutex> Host::lock() const {
    return std::unique_lock<std::recursive_mutex>(mutex_);
}

size_t Host::instance_count() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return accounts_.size();
}

Host::Snapshot Host::snapshot() const {
    return Snapshot{journal_.size(), logs_.size()};
}

void Host::revert(const Snapshot& snap) {
    for (const auto& created : journal_.revert(snap.journal_size)) {
        accounts_.erase(created.to_hex());
    }
    logs_.resize(snap.log_count);
}

std::vector<Log> Host::take_logs(const Snapshot& snap) {
    std::vector<Log> out(std::make_move_iterator(logs_.begin() + snap.log_count),
                         std::make_move_iterator(logs_.end()));
    logs_.resize(snap.log_count);
    return out;
}

Host::Account* Host::find(const Address& addr) {
    auto it = accounts_.find(addr.to_hex());
    return it == accounts_.end() ? nullptr : it->second.get();
}

const Host::Account* Host::find(const Address& addr) const {
    auto it = accounts_.find(addr.to_hex());
    return it == accounts_.end() ? nullptr : it->second.get();
}

Address Host::next_address(const Address& deployer) {
    // keccak256(deployer || nonce)[12:]
    uint64_t nonce = nonces_[deployer.to_hex()]++;
    Bytes preimage(deployer.bytes.begin(), deployer.bytes.end());
    for (int i = 7; i >= 0; --i) {
        preimage.push_back(static_cast<uint8_t>((nonce >> (i * 8)) & 0xFF));
    }

    auto hash = crypto::Keccak256::hash(preimage);
    Address addr;
    std::copy(hash.begin() + 12, hash.end(), addr.bytes.begin());
    return addr;
}

} // namespace execution
} // namespace slotguard
