#include "core/transfer.h"
#include "core/accounts.h"
#include "core/wallet.h"
#include "core/ledger.h"
#include "core/payments.h"
#include "database/database.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"

#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>

namespace paycore {

static const char* VERSION = "1.0.0";

enum ExitCode {
    EXIT_OK = 0,
    EXIT_FAILED = 1,
    EXIT_USAGE = 2
};

struct CliConfig {
    std::string dataDir;
    std::string configPath;
    bool verbose = false;
    bool showHelp = false;
    bool showVersion = false;
    std::vector<std::string> commandArgs;
};

void printHelp(const char* progName) {
    std::cout << "Usage: " << progName << " [options] <command> [args]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help             Show this help\n";
    std::cout << "  -V, --version          Show version\n";
    std::cout << "  -d, --datadir PATH     Data directory\n";
    std::cout << "  -c, --config PATH      Configuration file\n";
    std::cout << "  -v, --verbose          Log to the console\n\n";
    std::cout << "Commands:\n";
    std::cout << "  open IDENTIFIER [approved]\n";
    std::cout << "  approve ACCOUNT\n";
    std::cout << "  close ACCOUNT\n";
    std::cout << "  accounts [LIMIT]\n";
    std::cout << "  deposit ACCOUNT_ID AMOUNT REFERENCE [DESCRIPTION]\n";
    std::cout << "  transfer FROM_ID RECIPIENT AMOUNT KEY [DESCRIPTION]\n";
    std::cout << "  balance ACCOUNT_ID\n";
    std::cout << "  history ACCOUNT_ID [LIMIT] [CURSOR]\n";
    std::cout << "  ledger TRANSACTION_ID\n";
    std::cout << "  intent-create ACCOUNT_ID AMOUNT [DESCRIPTION]\n";
    std::cout << "  intent-event EVENT_ID INTENT_ID succeeded|failed|expired [MESSAGE]\n";
    std::cout << "  verify\n";
}

bool parseArgs(int argc, char* argv[], CliConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {"datadir", required_argument, nullptr, 'd'},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "+hVd:c:v", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'V':
                config.showVersion = true;
                return true;
            case 'd':
                config.dataDir = optarg;
                break;
            case 'c':
                config.configPath = optarg;
                break;
            case 'v':
                config.verbose = true;
                break;
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; i++) {
        config.commandArgs.push_back(argv[i]);
    }
    return true;
}

static bool parseLimit(const std::string& text, size_t& out) {
    if (text.empty() || text.size() > 6) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    out = static_cast<size_t>(std::stoul(text));
    return true;
}

static void printOutcome(const core::TransferOutcome& outcome, uint32_t minorDigits) {
    std::cout << "code:        " << errorCodeName(outcome.code) << "\n";
    std::cout << "certainty:   " << core::toString(outcome.certainty) << "\n";
    if (outcome.alreadyProcessed) std::cout << "replayed:    yes\n";
    if (!outcome.transaction.id.empty()) {
        const auto& tx = outcome.transaction;
        std::cout << "transaction: " << tx.id << "\n";
        std::cout << "status:      " << core::toString(tx.status) << "\n";
        std::cout << "amount:      " << core::formatAmount(tx.amount, minorDigits) << " " << tx.currency << "\n";
    }
    if (!outcome.ok() && !outcome.message.empty()) {
        std::cout << "message:     " << outcome.message << "\n";
    }
    if (isRetryable(outcome.code)) {
        std::cout << "retry:       resubmit with the same idempotency key\n";
    }
}

static void printIntent(const core::PaymentIntent& intent, uint32_t minorDigits) {
    std::cout << "intent:      " << intent.id << "\n";
    std::cout << "account:     " << intent.accountId << "\n";
    std::cout << "amount:      " << core::formatAmount(intent.amount, minorDigits) << " " << intent.currency << "\n";
    std::cout << "status:      " << core::toString(intent.status) << "\n";
    if (!intent.transactionId.empty()) std::cout << "transaction: " << intent.transactionId << "\n";
    if (!intent.errorMessage.empty()) std::cout << "error:       " << intent.errorMessage << "\n";
}

static int failWith(const Error& error) {
    std::cerr << errorCodeName(error.code) << ": " << error.message << "\n";
    return EXIT_FAILED;
}

int runCommand(core::TransferEngine& engine, core::PaymentReconciler& payments,
               const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    const uint32_t digits = engine.config().minorDigits;

    if (cmd == "open") {
        if (args.size() < 2) return EXIT_USAGE;
        core::Verification v = core::Verification::PENDING;
        if (args.size() > 2 && (args[2] == "approved" || args[2] == "--approved")) {
            v = core::Verification::APPROVED;
        }
        auto created = engine.accounts().createAccount(args[1], v);
        if (!created.ok()) return failWith(created.error());
        std::cout << created.value().id << "\n";
        return EXIT_OK;
    }

    if (cmd == "approve" || cmd == "close") {
        if (args.size() < 2) return EXIT_USAGE;
        core::Account account;
        if (!engine.accounts().resolve(args[1], account)) {
            std::cerr << "NOT_FOUND: no account " << args[1] << "\n";
            return EXIT_FAILED;
        }
        auto done = cmd == "approve"
            ? engine.accounts().setVerification(account.id, core::Verification::APPROVED)
            : engine.accounts().deactivate(account.id);
        if (!done.ok()) return failWith(done.error());
        std::cout << "OK\n";
        return EXIT_OK;
    }

    if (cmd == "accounts") {
        size_t limit = 100;
        if (args.size() > 1 && !parseLimit(args[1], limit)) return EXIT_USAGE;
        utils::TableFormatter table;
        table.setHeaders({"ID", "IDENTIFIER", "VERIFICATION", "ACTIVE", "BALANCE"});
        table.setNumeric(4);
        for (const auto& account : engine.accounts().list(limit)) {
            core::Wallet wallet;
            std::string balance = engine.wallets().findByAccount(account.id, wallet)
                ? core::formatAmount(wallet.balance, digits) : "-";
            table.addRow({account.id, account.identifier, core::toString(account.verification),
                          account.active ? "yes" : "no", balance});
        }
        std::cout << table.render();
        return EXIT_OK;
    }

    if (cmd == "deposit") {
        if (args.size() < 4) return EXIT_USAGE;
        core::CreditRequest req;
        req.accountId = args[1];
        req.amount = args[2];
        req.externalReference = args[3];
        if (args.size() > 4) req.description = args[4];
        auto outcome = engine.credit(req);
        printOutcome(outcome, digits);
        return outcome.ok() ? EXIT_OK : EXIT_FAILED;
    }

    if (cmd == "transfer") {
        if (args.size() < 5) return EXIT_USAGE;
        core::TransferRequest req;
        req.initiatorId = args[1];
        req.recipient = args[2];
        req.amount = args[3];
        req.idempotencyKey = args[4];
        if (args.size() > 5) req.description = args[5];
        auto outcome = engine.transfer(req);
        printOutcome(outcome, digits);
        return outcome.ok() ? EXIT_OK : EXIT_FAILED;
    }

    if (cmd == "balance") {
        if (args.size() < 2) return EXIT_USAGE;
        auto balance = engine.getBalance(args[1]);
        if (!balance.ok()) return failWith(balance.error());
        std::cout << core::formatAmount(balance.value(), digits) << " " << engine.config().currency << "\n";
        return EXIT_OK;
    }

    if (cmd == "history") {
        if (args.size() < 2) return EXIT_USAGE;
        size_t limit = 20;
        if (args.size() > 2 && !parseLimit(args[2], limit)) return EXIT_USAGE;
        std::string cursor = args.size() > 3 ? args[3] : "";
        auto page = engine.getHistory(args[1], cursor, limit);
        if (!page.ok()) return failWith(page.error());

        utils::TableFormatter table;
        table.setHeaders({"TIME", "ID", "KIND", "STATUS", "FROM", "TO", "AMOUNT"});
        table.setNumeric(6);
        for (const auto& tx : page.value().items) {
            table.addRow({utils::Formatter::formatTimestamp(tx.createdAt), tx.id, core::toString(tx.kind),
                          core::toString(tx.status), tx.sourceAccountId.empty() ? "external" : tx.sourceAccountId,
                          tx.destinationAccountId, core::formatAmount(tx.amount, digits)});
        }
        std::cout << table.render();
        if (!page.value().nextCursor.empty()) {
            std::cout << "next cursor: " << page.value().nextCursor << "\n";
        }
        return EXIT_OK;
    }

    if (cmd == "ledger") {
        if (args.size() < 2) return EXIT_USAGE;
        auto entries = engine.getLedgerEntries(args[1]);
        if (entries.empty()) {
            std::cerr << "No ledger entries for " << args[1] << "\n";
            return EXIT_FAILED;
        }
        utils::TableFormatter table;
        table.setHeaders({"LEG", "WALLET", "ACCOUNT", "AMOUNT", "BALANCE AFTER"});
        table.setNumeric(3);
        table.setNumeric(4);
        for (const auto& e : entries) {
            table.addRow({core::toString(e.leg), e.walletId.empty() ? "external" : e.walletId,
                          e.accountId, core::formatAmount(e.amount, digits),
                          core::formatAmount(e.balanceAfter, digits)});
        }
        std::cout << table.render();
        return EXIT_OK;
    }

    if (cmd == "intent-create") {
        if (args.size() < 3) return EXIT_USAGE;
        auto intent = payments.createIntent(args[1], args[2], args.size() > 3 ? args[3] : "");
        if (!intent.ok()) return failWith(intent.error());
        printIntent(intent.value(), digits);
        return EXIT_OK;
    }

    if (cmd == "intent-event") {
        if (args.size() < 4) return EXIT_USAGE;
        core::PaymentEventType type;
        if (!core::fromString(utils::Formatter::toUpper(args[3]), type)) return EXIT_USAGE;
        auto intent = payments.applyEvent(args[1], args[2], type, args.size() > 4 ? args[4] : "");
        if (!intent.ok()) return failWith(intent.error());
        printIntent(intent.value(), digits);
        return EXIT_OK;
    }

    if (cmd == "verify") {
        auto report = engine.ledger().verify();
        std::cout << "transactions checked: " << report.transactionsChecked << "\n";
        std::cout << "wallets checked:      " << report.walletsChecked << "\n";
        for (const auto& p : report.problems) std::cout << "  " << p << "\n";
        std::cout << (report.balanced ? "ledger balanced" : "LEDGER UNBALANCED") << "\n";
        return report.balanced ? EXIT_OK : EXIT_FAILED;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return EXIT_USAGE;
}

}

int main(int argc, char* argv[]) {
    paycore::CliConfig cli;

    const char* home = std::getenv("HOME");
    cli.dataDir = home ? std::string(home) + "/.paycore" : ".paycore";

    if (!paycore::parseArgs(argc, argv, cli)) {
        paycore::printHelp(argv[0]);
        return paycore::EXIT_USAGE;
    }
    if (cli.showHelp) {
        paycore::printHelp(argv[0]);
        return paycore::EXIT_OK;
    }
    if (cli.showVersion) {
        std::cout << "paycore " << paycore::VERSION << "\n";
        return paycore::EXIT_OK;
    }
    if (cli.commandArgs.empty()) {
        paycore::printHelp(argv[0]);
        return paycore::EXIT_USAGE;
    }

    auto& config = paycore::utils::Config::instance();
    config.setDataDir(cli.dataDir);
    std::string configPath = cli.configPath.empty() ? cli.dataDir + "/paycore.conf" : cli.configPath;
    if (!config.load(configPath) && !cli.configPath.empty()) {
        std::cerr << "Cannot read configuration " << configPath << "\n";
        return paycore::EXIT_USAGE;
    }

    auto storageCfg = config.getStorageConfig();
    auto logCfg = config.getLogConfig();

    std::error_code ec;
    std::filesystem::create_directories(storageCfg.dataDir, ec);
    if (ec) {
        std::cerr << "Cannot create data directory " << storageCfg.dataDir << ": " << ec.message() << "\n";
        return paycore::EXIT_FAILED;
    }

    logCfg.console = logCfg.console && cli.verbose;
    paycore::utils::Logger::configure(logCfg, storageCfg.dataDir);

    paycore::database::Storage storage;
    std::string dbPath = storageCfg.dataDir + "/" + storageCfg.dbFile;
    auto engineCfg = config.getEngineConfig();
    if (!storage.open(dbPath, engineCfg.lockTimeoutMs)) {
        std::cerr << "Failed to open ledger " << dbPath << ": " << storage.lastError() << "\n";
        paycore::utils::Logger::shutdown();
        return paycore::EXIT_FAILED;
    }

    int result = paycore::EXIT_FAILED;
    try {
        paycore::core::TransferEngine engine(storage, engineCfg);
        paycore::core::PaymentReconciler payments(storage, engine);
        result = paycore::runCommand(engine, payments, cli.commandArgs);
        if (result == paycore::EXIT_USAGE) paycore::printHelp(argv[0]);
    } catch (const paycore::database::DatabaseError& e) {
        std::cerr << "Storage failure: " << e.what() << "\n";
        result = paycore::EXIT_FAILED;
    }

    storage.close();
    paycore::utils::Logger::shutdown();
    return result;
}
