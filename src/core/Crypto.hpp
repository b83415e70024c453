#pragma once

#include <string>
#include <cstddef>

namespace NCrypto {
    // lowercase hex, empty on openssl failure
    std::string sha256(const std::string& in);

    // hex of `bytes` bytes from the openssl CSPRNG. Throws if the CSPRNG fails.
    std::string randomHex(size_t bytes);
};
