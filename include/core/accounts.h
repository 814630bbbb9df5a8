#pragma once

#include "core/types.h"
#include "database/database.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace paycore {
namespace core {

class WalletStore;

// Owns accounts and provisions each one together with its wallet. Reads go
// through the committed-state connection and throw database::DatabaseError
// on storage failure.
class AccountDirectory {
public:
    AccountDirectory(database::Storage& storage, WalletStore& wallets,
                     const std::string& currency, uint32_t lockTimeoutMs);
    ~AccountDirectory();

    Result<Account> createAccount(const std::string& identifier,
                                  Verification verification = Verification::PENDING);

    bool findById(const std::string& accountId, Account& out) const;
    bool findByIdentifier(const std::string& identifier, Account& out) const;
    // Account id first, then identifier.
    bool resolve(const std::string& idOrIdentifier, Account& out) const;

    Result<void> setVerification(const std::string& accountId, Verification verification);
    Result<void> deactivate(const std::string& accountId);

    std::vector<Account> list(size_t limit = 100) const;
    size_t count() const;

    static bool isValidIdentifier(const std::string& identifier);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
