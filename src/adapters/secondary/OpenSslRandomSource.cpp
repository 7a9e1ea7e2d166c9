// src/adapters/secondary/OpenSslRandomSource.cpp
#include "adapters/secondary/OpenSslRandomSource.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <stdexcept>
#include <string>

namespace sessions::adapters::secondary {

std::vector<uint8_t> OpenSslRandomSource::randomBytes(std::size_t count) {
    std::vector<uint8_t> buffer(count);
    if (count == 0) {
        return buffer;
    }
    if (RAND_bytes(buffer.data(), static_cast<int>(count)) != 1) {
        char error[256];
        ERR_error_string_n(ERR_get_error(), error, sizeof(error));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + error);
    }
    return buffer;
}

} // namespace sessions::adapters::secondary
