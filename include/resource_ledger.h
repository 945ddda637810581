// resource_ledger.h
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "game_types.h"

enum class AccountKind {
    Player = 0,
    Country = 1
};

struct AccountKey {
    AccountKind kind = AccountKind::Player;
    EntityId id = kNoEntity;

    static AccountKey player(EntityId id) { return AccountKey{AccountKind::Player, id}; }
    static AccountKey country(EntityId id) { return AccountKey{AccountKind::Country, id}; }

    bool operator==(const AccountKey& other) const { return kind == other.kind && id == other.id; }
};

namespace std {
    template <>
    struct hash<AccountKey> {
        size_t operator()(const AccountKey& k) const {
            return std::hash<long long>()(static_cast<long long>(k.id)) ^ (static_cast<size_t>(k.kind) << 1);
        }
    };
}

// Integer resource balances for players and countries.
//
// Every account carries its own mutex: debits against one account serialize,
// debits against different accounts only share a read lock on the directory.
// The ledger never calls out while an account lock is held, so callers may take
// a ledger operation while holding a player lock but must not hold a war or
// border push lock (ledger before conflict).
class ResourceLedger {
public:
    struct Entry {
        AccountKey key;
        long long balance = 0;
        bool frozen = false;
    };

    bool openAccount(const AccountKey& key, long long initialBalance, OpError* error = nullptr);
    bool hasAccount(const AccountKey& key) const;

    // Atomic check-then-decrement. Fails without mutation when the balance is short.
    bool debit(const AccountKey& key, long long amount, OpError* error = nullptr);
    bool credit(const AccountKey& key, long long amount, OpError* error = nullptr);
    // Adds floor(rate); returns the amount added (0 on failure).
    long long generate(const AccountKey& key, double rate, OpError* error = nullptr);

    bool balance(const AccountKey& key, long long& out) const;
    bool isFrozen(const AccountKey& key) const;

    std::vector<Entry> entries() const;
    // Snapshot restore only: replaces or creates the account with the given balance.
    bool restoreAccount(const AccountKey& key, long long balance, OpError* error = nullptr);
    void clear();

private:
    struct Account {
        mutable std::mutex mutex;
        long long balance = 0;
        bool frozen = false;
    };

    std::shared_ptr<Account> findAccount(const AccountKey& key) const;
    // Caller holds account.mutex.
    bool checkHealthy(const AccountKey& key, Account& account, OpError* error) const;

    mutable std::shared_mutex m_directoryMutex;
    std::unordered_map<AccountKey, std::shared_ptr<Account>> m_accounts;
};

const char* accountKindName(AccountKind kind);
