#include "memory_store.hpp"

#include <set>

namespace consent {
namespace store {

class MemoryTransaction : public Transaction {
public:
    explicit MemoryTransaction(MemoryStore& store) : store_(store) {}

    ~MemoryTransaction() override {
        while (!guards_.empty()) {
            guards_.pop_back();
        }
    }

    Status lock_blocking(const std::string& key) override {
        if (held_.count(key)) return Status::Ok();
        guards_.push_back(store_.locks_.lock(key));
        held_.insert(key);
        return Status::Ok();
    }

    Status try_lock(const std::string& key) override {
        if (held_.count(key)) return Status::Ok();
        auto guard = store_.locks_.try_lock(key);
        if (!guard) {
            return make_error(ErrorKind::LockContention, "resource busy: " + key);
        }
        guards_.push_back(std::move(*guard));
        held_.insert(key);
        return Status::Ok();
    }

    std::optional<Contract> get_contract(const std::string& contract_id) override {
        auto staged = staged_contracts_.find(contract_id);
        if (staged != staged_contracts_.end()) return staged->second;

        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        auto it = store_.contracts_.find(contract_id);
        if (it == store_.contracts_.end()) return std::nullopt;
        return it->second;
    }

    void put_contract(const Contract& contract) override {
        staged_contracts_[contract.id] = contract;
    }

    std::vector<std::string> contracts_expiring(Timestamp now) override {
        std::vector<std::string> ids;
        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        for (const auto& kv : store_.contracts_) {
            const Contract& c = kv.second;
            if (!protocol::is_terminal(c.status) && c.expired_at(now)) {
                ids.push_back(c.id);
            }
        }
        return ids;
    }

    std::optional<Pin> get_pin(const std::string& pin_id) override {
        auto staged = staged_pins_.find(pin_id);
        if (staged != staged_pins_.end()) return staged->second;

        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        auto it = store_.pins_.find(pin_id);
        if (it == store_.pins_.end()) return std::nullopt;
        return it->second;
    }

    void put_pin(const Pin& pin) override {
        staged_pins_[pin.id] = pin;
    }

    std::optional<AuditLogEntry> latest_audit_entry(const std::string& agent_id) override {
        for (auto it = staged_audit_.rbegin(); it != staged_audit_.rend(); ++it) {
            if (it->agent_id == agent_id) return *it;
        }

        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        auto it = store_.audit_by_agent_.find(agent_id);
        if (it == store_.audit_by_agent_.end() || it->second.empty()) return std::nullopt;
        return store_.audit_log_[it->second.back()];
    }

    void append_audit_entry(const AuditLogEntry& entry) override {
        staged_audit_.push_back(entry);
    }

    std::vector<AuditLogEntry> audit_entries(const AuditFilter& filter) override {
        std::vector<AuditLogEntry> out;
        {
            std::lock_guard<std::mutex> lock(store_.data_mutex_);
            if (filter.agent_id) {
                auto it = store_.audit_by_agent_.find(*filter.agent_id);
                if (it != store_.audit_by_agent_.end()) {
                    for (std::size_t pos : it->second) {
                        const auto& entry = store_.audit_log_[pos];
                        if (filter.matches(entry)) out.push_back(entry);
                    }
                }
            } else {
                for (const auto& entry : store_.audit_log_) {
                    if (filter.matches(entry)) out.push_back(entry);
                }
            }
        }
        for (const auto& entry : staged_audit_) {
            if (filter.matches(entry)) out.push_back(entry);
        }
        return out;
    }

    Status commit() override {
        if (committed_) {
            return make_error(ErrorKind::InvalidState, "transaction already committed");
        }

        std::lock_guard<std::mutex> lock(store_.data_mutex_);
        for (auto& kv : staged_contracts_) {
            store_.contracts_[kv.first] = std::move(kv.second);
        }
        for (auto& kv : staged_pins_) {
            store_.pins_[kv.first] = std::move(kv.second);
        }
        for (auto& entry : staged_audit_) {
            store_.audit_by_agent_[entry.agent_id].push_back(store_.audit_log_.size());
            store_.audit_log_.push_back(std::move(entry));
        }

        staged_contracts_.clear();
        staged_pins_.clear();
        staged_audit_.clear();
        committed_ = true;
        return Status::Ok();
    }

private:
    MemoryStore& store_;

    // Released in reverse acquisition order when the transaction dies.
    std::vector<KeyedLocks::Guard> guards_;
    std::set<std::string> held_;

    std::map<std::string, Contract> staged_contracts_;
    std::map<std::string, Pin> staged_pins_;
    std::vector<AuditLogEntry> staged_audit_;
    bool committed_ = false;
};

std::unique_ptr<Transaction> MemoryStore::begin() {
    return std::make_unique<MemoryTransaction>(*this);
}

std::size_t MemoryStore::contract_count() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return contracts_.size();
}

std::size_t MemoryStore::pin_count() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return pins_.size();
}

std::size_t MemoryStore::audit_entry_count() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return audit_log_.size();
}

bool MemoryStore::overwrite_audit_entry(const std::string& log_id,
                                        const std::function<void(AuditLogEntry&)>& mutate) {
    std::lock_guard<std::mutex> lock(data_mutex_);
    for (auto& entry : audit_log_) {
        if (entry.log_id == log_id) {
            mutate(entry);
            return true;
        }
    }
    return false;
}

} // namespace store
} // namespace consent
