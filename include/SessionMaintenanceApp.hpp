#pragma once

#include "ports/input/ISessionLifecycleManager.hpp"
#include "application/SessionMaintenance.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace sessions {

/**
 * @class SessionMaintenanceApp
 * @brief Консольная утилита обслуживания сессий
 *
 * Template Method:
 * 1. loadEnvironment() - разбор команды и аргументов
 * 2. configureInjection() - сборка зависимостей через Boost.DI
 * 3. execute() - выполнение команды
 *
 * Коды возврата: 0 - успех, 1 - ошибка выполнения, 2 - неверная команда.
 */
class SessionMaintenanceApp {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FAILURE_RUNTIME = 1;
    static constexpr int EXIT_USAGE = 2;

    SessionMaintenanceApp() = default;
    virtual ~SessionMaintenanceApp() = default;

    int run(int argc, char* argv[]);

    static void printUsage(std::ostream& out);

protected:
    virtual void loadEnvironment(int argc, char* argv[]);

    /**
     * @brief Собрать граф зависимостей
     *
     * Настройки читаются из ENV здесь, а не в loadEnvironment(),
     * чтобы generate-key и help работали без БД и ключа.
     */
    virtual void configureInjection();

    virtual int execute();

    std::string command_;
    std::vector<std::string> args_;

    std::shared_ptr<ports::input::ISessionLifecycleManager> lifecycle_;
    std::shared_ptr<application::SessionMaintenance> maintenance_;

private:
    bool needsStorage() const;
    bool isValidInvocation() const;
};

} // namespace sessions
