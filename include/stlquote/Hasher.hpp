#pragma once
#include <cstddef>
#include <string>

namespace stlquote {

    class Hasher {
    public:
        // Lower-case hex SHA-256 of an in-memory buffer.
        static std::string sha256(const void* data, std::size_t size);

        static std::string sha256(const std::string& buffer) {
            return sha256(buffer.data(), buffer.size());
        }
    };

} // namespace stlquote
