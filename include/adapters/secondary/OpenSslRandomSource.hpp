#pragma once

#include "ports/output/IRandomSource.hpp"

namespace sessions::adapters::secondary {

/**
 * @brief CSPRNG на основе OpenSSL RAND_bytes
 */
class OpenSslRandomSource : public ports::output::IRandomSource {
public:
    OpenSslRandomSource() = default;

    std::vector<uint8_t> randomBytes(std::size_t count) override;
};

} // namespace sessions::adapters::secondary
