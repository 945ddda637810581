// resource_ledger.cpp
#include "resource_ledger.h"

#include <cmath>
#include <limits>
#include <sstream>

#include "log.h"

namespace {

std::string describe(const AccountKey& key) {
    std::ostringstream oss;
    oss << accountKindName(key.kind) << "#" << key.id;
    return oss.str();
}

} // namespace

const char* accountKindName(AccountKind kind) {
    switch (kind) {
        case AccountKind::Player: return "player";
        case AccountKind::Country: return "country";
        default: return "account";
    }
}

bool ResourceLedger::openAccount(const AccountKey& key, long long initialBalance, OpError* error) {
    if (initialBalance < 0) {
        return fail(error, ErrorKind::InvalidState, "Initial balance must be non-negative");
    }
    std::unique_lock<std::shared_mutex> lock(m_directoryMutex);
    if (m_accounts.count(key)) {
        return fail(error, ErrorKind::Conflict, "Account " + describe(key) + " already exists");
    }
    auto account = std::make_shared<Account>();
    account->balance = initialBalance;
    m_accounts.emplace(key, std::move(account));
    return true;
}

bool ResourceLedger::hasAccount(const AccountKey& key) const {
    return findAccount(key) != nullptr;
}

std::shared_ptr<ResourceLedger::Account> ResourceLedger::findAccount(const AccountKey& key) const {
    std::shared_lock<std::shared_mutex> lock(m_directoryMutex);
    auto it = m_accounts.find(key);
    if (it == m_accounts.end()) return nullptr;
    return it->second;
}

bool ResourceLedger::checkHealthy(const AccountKey& key, Account& account, OpError* error) const {
    if (account.frozen) {
        return fail(error, ErrorKind::InvariantViolation, "Account " + describe(key) + " is frozen");
    }
    if (account.balance < 0) {
        account.frozen = true;
        logging::error("Ledger", "Negative balance " + std::to_string(account.balance) + " on " + describe(key) +
                                 "; account frozen.");
        return fail(error, ErrorKind::InvariantViolation, "Account " + describe(key) + " has a negative balance");
    }
    return true;
}

bool ResourceLedger::debit(const AccountKey& key, long long amount, OpError* error) {
    if (amount < 0) {
        return fail(error, ErrorKind::InvalidState, "Debit amount must be non-negative");
    }
    std::shared_ptr<Account> account = findAccount(key);
    if (!account) {
        return fail(error, ErrorKind::NotFound, "Account " + describe(key) + " not found");
    }

    std::lock_guard<std::mutex> lock(account->mutex);
    if (!checkHealthy(key, *account, error)) {
        return false;
    }
    if (account->balance < amount) {
        return failInsufficient(error, "Not enough resources. Required: " + std::to_string(amount),
                                amount, account->balance);
    }
    account->balance -= amount;
    return true;
}

bool ResourceLedger::credit(const AccountKey& key, long long amount, OpError* error) {
    if (amount < 0) {
        return fail(error, ErrorKind::InvalidState, "Credit amount must be non-negative");
    }
    std::shared_ptr<Account> account = findAccount(key);
    if (!account) {
        return fail(error, ErrorKind::NotFound, "Account " + describe(key) + " not found");
    }

    std::lock_guard<std::mutex> lock(account->mutex);
    if (!checkHealthy(key, *account, error)) {
        return false;
    }
    if (account->balance > std::numeric_limits<long long>::max() - amount) {
        return fail(error, ErrorKind::InvalidState, "Credit would overflow " + describe(key));
    }
    account->balance += amount;
    return true;
}

long long ResourceLedger::generate(const AccountKey& key, double rate, OpError* error) {
    if (!std::isfinite(rate) || rate < 0.0) {
        fail(error, ErrorKind::InvalidState, "Generation rate must be a non-negative number");
        return 0;
    }
    const long long amount = static_cast<long long>(std::floor(rate));
    if (!credit(key, amount, error)) {
        return 0;
    }
    return amount;
}

bool ResourceLedger::balance(const AccountKey& key, long long& out) const {
    std::shared_ptr<Account> account = findAccount(key);
    if (!account) return false;
    std::lock_guard<std::mutex> lock(account->mutex);
    out = account->balance;
    return true;
}

bool ResourceLedger::isFrozen(const AccountKey& key) const {
    std::shared_ptr<Account> account = findAccount(key);
    if (!account) return false;
    std::lock_guard<std::mutex> lock(account->mutex);
    return account->frozen;
}

std::vector<ResourceLedger::Entry> ResourceLedger::entries() const {
    std::vector<std::pair<AccountKey, std::shared_ptr<Account>>> accounts;
    {
        std::shared_lock<std::shared_mutex> lock(m_directoryMutex);
        accounts.assign(m_accounts.begin(), m_accounts.end());
    }
    std::vector<Entry> out;
    out.reserve(accounts.size());
    for (const auto& kv : accounts) {
        std::lock_guard<std::mutex> lock(kv.second->mutex);
        out.push_back(Entry{kv.first, kv.second->balance, kv.second->frozen});
    }
    return out;
}

bool ResourceLedger::restoreAccount(const AccountKey& key, long long balance, OpError* error) {
    if (balance < 0) {
        return fail(error, ErrorKind::InvariantViolation,
                    "Negative balance " + std::to_string(balance) + " for " + describe(key));
    }
    std::unique_lock<std::shared_mutex> lock(m_directoryMutex);
    auto account = std::make_shared<Account>();
    account->balance = balance;
    m_accounts[key] = std::move(account);
    return true;
}

void ResourceLedger::clear() {
    std::unique_lock<std::shared_mutex> lock(m_directoryMutex);
    m_accounts.clear();
}
