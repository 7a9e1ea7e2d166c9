// src/SessionMaintenanceApp.cpp
#include "SessionMaintenanceApp.hpp"

// Application
#include "application/SessionLifecycleManager.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresSessionStore.hpp"
#include "adapters/secondary/AeadIdentityTokenCodec.hpp"
#include "adapters/secondary/OpenSslRandomSource.hpp"
#include "adapters/secondary/SystemClock.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/CodecSettings.hpp"
#include "settings/SessionSettings.hpp"

#include <boost/di.hpp>
#include <iostream>

namespace di = boost::di;

namespace sessions {

int SessionMaintenanceApp::run(int argc, char* argv[]) {
    loadEnvironment(argc, argv);

    if (!isValidInvocation()) {
        std::cerr << "[SessionMaintenanceApp] Unknown command or missing argument: "
                  << (command_.empty() ? "<none>" : command_) << std::endl;
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    if (needsStorage()) {
        configureInjection();
    }
    return execute();
}

void SessionMaintenanceApp::printUsage(std::ostream& out) {
    out << "Usage: session-maintenance <command>\n"
        << "\n"
        << "Commands:\n"
        << "  cleanup-expired             Delete all expired sessions\n"
        << "  cleanup-duplicates          Keep one session per (identity, scope)\n"
        << "  revoke-identity <identity>  Delete every session of an identity\n"
        << "  generate-key                Print a new SESSION_ENCRYPTION_KEY\n"
        << "  help                        Show this message\n";
}

void SessionMaintenanceApp::loadEnvironment(int argc, char* argv[]) {
    if (argc > 1) {
        command_ = argv[1];
    }
    for (int i = 2; i < argc; ++i) {
        args_.emplace_back(argv[i]);
    }
}

void SessionMaintenanceApp::configureInjection() {
    std::cout << "[SessionMaintenanceApp] Configuring Boost.DI injection..." << std::endl;

    // ====================================================================
    // Settings & Infrastructure
    // ====================================================================

    auto dbSettings = std::make_shared<settings::DbSettings>();
    auto codecSettings = std::make_shared<settings::CodecSettings>();
    auto sessionSettings = std::make_shared<settings::SessionSettings>();

    auto random = std::make_shared<adapters::secondary::OpenSslRandomSource>();
    auto codec = std::make_shared<adapters::secondary::AeadIdentityTokenCodec>(
        codecSettings->getKey(), codecSettings->getContext(), random);

    auto injector = di::make_injector(

        di::bind<settings::DbSettings>().to(dbSettings),
        di::bind<settings::SessionSettings>().to(sessionSettings),

        // ================================================================
        // Secondary Adapters (Output Ports implementations)
        // ================================================================

        di::bind<ports::output::ISessionStore>()
            .to<adapters::secondary::PostgresSessionStore>()
            .in(di::singleton),

        di::bind<ports::output::IIdentityTokenCodec>().to(codec),

        di::bind<ports::output::IRandomSource>().to(random),

        di::bind<ports::output::IClock>()
            .to<adapters::secondary::SystemClock>()
            .in(di::singleton),

        // ================================================================
        // Application Services
        // ================================================================

        di::bind<ports::input::ISessionLifecycleManager>()
            .to<application::SessionLifecycleManager>()
            .in(di::singleton)
    );

    lifecycle_ = injector.create<std::shared_ptr<ports::input::ISessionLifecycleManager>>();
    maintenance_ = injector.create<std::shared_ptr<application::SessionMaintenance>>();

    std::cout << "[SessionMaintenanceApp] DI Injector configured" << std::endl;
}

int SessionMaintenanceApp::execute() {
    if (command_ == "help") {
        printUsage(std::cout);
        return EXIT_OK;
    }

    if (command_ == "generate-key") {
        adapters::secondary::OpenSslRandomSource random;
        std::cout << application::SessionMaintenance::generateEncryptionKey(random) << std::endl;
        return EXIT_OK;
    }

    if (command_ == "cleanup-expired") {
        auto deleted = maintenance_->purgeExpired();
        std::cout << "Deleted " << deleted << " expired sessions" << std::endl;
        return EXIT_OK;
    }

    if (command_ == "cleanup-duplicates") {
        auto report = maintenance_->purgeDuplicates();
        std::cout << "Scanned:  " << report.scanned << "\n"
                  << "Unique:   " << report.unique << "\n"
                  << "Deleted:  " << report.deleted << "\n"
                  << "Skipped:  " << report.skipped << std::endl;
        return EXIT_OK;
    }

    if (command_ == "revoke-identity") {
        auto deleted = lifecycle_->deleteByIdentity(args_.front());
        std::cout << "Deleted " << deleted << " sessions" << std::endl;
        return EXIT_OK;
    }

    printUsage(std::cerr);
    return EXIT_USAGE;
}

bool SessionMaintenanceApp::needsStorage() const {
    return command_ == "cleanup-expired" ||
           command_ == "cleanup-duplicates" ||
           command_ == "revoke-identity";
}

bool SessionMaintenanceApp::isValidInvocation() const {
    if (command_ == "revoke-identity") {
        return args_.size() == 1 && !args_.front().empty();
    }
    return command_ == "help" ||
           command_ == "generate-key" ||
           command_ == "cleanup-expired" ||
           command_ == "cleanup-duplicates";
}

} // namespace sessions
