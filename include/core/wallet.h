#ifndef PAYCORE_CORE_WALLET_H
#define PAYCORE_CORE_WALLET_H

#include "core/types.h"
#include "database/database.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace paycore {
namespace core {

// The only code that writes wallet balances.
class WalletStore {
public:
    explicit WalletStore(database::Storage& storage);
    ~WalletStore();

    Wallet create(database::UnitOfWork& uow, const std::string& accountId, const std::string& currency);

    // Reads a wallet whose row lock uow holds. Throws std::logic_error when the
    // lock is not held or the wallet does not exist.
    Wallet getForUpdate(database::UnitOfWork& uow, const std::string& walletId);

    // Writes balance with an optimistic version check and bumps wallet.version.
    // CONCURRENCY_CONFLICT when the stored version moved.
    Result<void> save(database::UnitOfWork& uow, Wallet& wallet);

    Result<void> close(database::UnitOfWork& uow, const std::string& walletId);

    bool findById(const std::string& walletId, Wallet& out) const;
    bool findByAccount(const std::string& accountId, Wallet& out) const;
    std::vector<Wallet> all() const;
    Amount totalBalance() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}

#endif
