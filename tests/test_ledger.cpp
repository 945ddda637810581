#include <atomic>
#include <iostream>
#include <thread>
#include <vector>

#include "resource_ledger.h"

#define FL_ASSERT(expr)                                                                             \
    do {                                                                                            \
        if (!(expr)) {                                                                              \
            std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";      \
            return 1;                                                                               \
        }                                                                                           \
    } while (0)

int test_ledger() {
    ResourceLedger ledger;
    const AccountKey player = AccountKey::player(1);
    const AccountKey country = AccountKey::country(1);

    FL_ASSERT(ledger.openAccount(player, 100));
    FL_ASSERT(ledger.openAccount(country, 1000));
    {
        OpError err;
        FL_ASSERT(!ledger.openAccount(player, 5, &err));
        FL_ASSERT(err.kind == ErrorKind::Conflict);
    }
    // Same id, different kind: distinct accounts.
    long long balance = 0;
    FL_ASSERT(ledger.balance(player, balance) && balance == 100);
    FL_ASSERT(ledger.balance(country, balance) && balance == 1000);

    // Short debit fails without mutation and reports the shortfall.
    {
        OpError err;
        FL_ASSERT(!ledger.debit(player, 150, &err));
        FL_ASSERT(err.kind == ErrorKind::InsufficientResources);
        FL_ASSERT(err.required == 150);
        FL_ASSERT(err.available == 100);
        FL_ASSERT(ledger.balance(player, balance) && balance == 100);
    }
    {
        OpError err;
        FL_ASSERT(!ledger.debit(player, -1, &err));
        FL_ASSERT(err.kind == ErrorKind::InvalidState);
        FL_ASSERT(!ledger.credit(player, -1, &err));
        FL_ASSERT(!ledger.debit(AccountKey::player(99), 1, &err));
        FL_ASSERT(err.kind == ErrorKind::NotFound);
    }

    FL_ASSERT(ledger.debit(player, 100));
    FL_ASSERT(ledger.balance(player, balance) && balance == 0);
    FL_ASSERT(ledger.credit(player, 10));
    FL_ASSERT(ledger.balance(player, balance) && balance == 10);

    // generate adds floor(rate).
    FL_ASSERT(ledger.generate(country, 2.7) == 2);
    FL_ASSERT(ledger.generate(country, 0.5) == 0);
    FL_ASSERT(ledger.balance(country, balance) && balance == 1002);

    // Restores reject negative balances.
    {
        OpError err;
        FL_ASSERT(!ledger.restoreAccount(AccountKey::player(7), -3, &err));
        FL_ASSERT(err.kind == ErrorKind::InvariantViolation);
    }

    // Concurrent debits of 10 against 95: exactly nine succeed, 5 remains.
    {
        ResourceLedger contended;
        const AccountKey key = AccountKey::player(42);
        FL_ASSERT(contended.openAccount(key, 95));
        std::atomic<int> successes{0};
        std::atomic<int> shortfalls{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < 25; ++i) {
                    OpError err;
                    if (contended.debit(key, 10, &err)) {
                        ++successes;
                    } else if (err.kind == ErrorKind::InsufficientResources) {
                        ++shortfalls;
                    }
                }
            });
        }
        for (auto& th : threads) th.join();
        FL_ASSERT(successes.load() == 9);
        FL_ASSERT(shortfalls.load() == 8 * 25 - 9);
        FL_ASSERT(contended.balance(key, balance) && balance == 5);
    }

    // Debits on different accounts do not interfere.
    {
        ResourceLedger ledger2;
        for (EntityId id = 1; id <= 4; ++id) {
            FL_ASSERT(ledger2.openAccount(AccountKey::player(id), 1000));
        }
        std::vector<std::thread> threads;
        for (EntityId id = 1; id <= 4; ++id) {
            threads.emplace_back([&ledger2, id]() {
                for (int i = 0; i < 1000; ++i) {
                    ledger2.debit(AccountKey::player(id), 1);
                }
            });
        }
        for (auto& th : threads) th.join();
        for (EntityId id = 1; id <= 4; ++id) {
            FL_ASSERT(ledger2.balance(AccountKey::player(id), balance) && balance == 0);
        }
    }

    FL_ASSERT(ledger.entries().size() == 2);
    return 0;
}
