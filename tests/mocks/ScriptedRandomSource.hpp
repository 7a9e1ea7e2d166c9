#pragma once

#include "ports/output/IRandomSource.hpp"
#include <map>
#include <deque>
#include <random>

namespace sessions::tests::mocks {

/**
 * @brief Детерминированный источник случайности
 *
 * Заготовленные ответы хранятся по запрошенной длине: так можно
 * подменить идентификатор сессии (32 байта), не затрагивая код (4 байта)
 * и nonce (12 байт). Без заготовок байты берутся из mt19937 с фиксированным seed.
 */
class ScriptedRandomSource : public ports::output::IRandomSource {
public:
    std::vector<uint8_t> randomBytes(std::size_t count) override {
        auto& queue = scripted_[count];
        if (!queue.empty()) {
            auto bytes = queue.front();
            queue.pop_front();
            return bytes;
        }

        std::vector<uint8_t> bytes(count);
        for (auto& b : bytes) {
            b = static_cast<uint8_t>(engine_() & 0xFF);
        }
        return bytes;
    }

    void script(std::vector<uint8_t> bytes) {
        scripted_[bytes.size()].push_back(std::move(bytes));
    }

    /**
     * @brief Заготовить count одинаковых ответов длины size, заполненных value
     */
    void scriptRepeated(std::size_t size, uint8_t value, int count) {
        for (int i = 0; i < count; ++i) {
            script(std::vector<uint8_t>(size, value));
        }
    }

private:
    std::map<std::size_t, std::deque<std::vector<uint8_t>>> scripted_;
    std::mt19937 engine_{42};
};

} // namespace sessions::tests::mocks
