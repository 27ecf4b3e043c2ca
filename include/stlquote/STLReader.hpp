#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "stlquote/Geometry.hpp"

namespace stlquote {

#pragma pack(push, 1)
    struct STLTriangleRaw {
        float normal[3];
        float vertex1[3];
        float vertex2[3];
        float vertex3[3];
        uint16_t attributeByteCount;
    } __attribute__((packed));
#pragma pack(pop)

    static_assert(sizeof(STLTriangleRaw) == 50, "STLTriangleRaw must be exactly 50 bytes");

    constexpr std::size_t kStlHeaderSize = 80;
    constexpr std::size_t kStlPreambleSize = kStlHeaderSize + sizeof(uint32_t);
    constexpr std::size_t kStlRecordSize = sizeof(STLTriangleRaw);

    /**
     * @class TriangleStream
     * @brief Lazy, single-pass view over the triangle records of a binary STL buffer
     *
     * Records are decoded one at a time straight from the caller's buffer,
     * which must outlive the stream. Records with a non-finite coordinate are
     * skipped and counted.
     */
    class TriangleStream {
    public:
        TriangleStream(const uint8_t* records, uint32_t declaredCount, uint32_t parseLimit);

        /**
         * @brief Decodes the next usable triangle
         *
         * @param out Receives the triangle
         * @return bool False once parseLimit records have been consumed
         */
        bool next(Triangle& out);

        uint32_t declaredCount() const { return declared; }
        uint32_t parseLimit() const { return limit; }
        uint32_t consumedCount() const { return index; }
        uint32_t skippedCount() const { return skipped; }
        uint32_t parsedCount() const { return index - skipped; }

        // True when the safety cap stopped the pass before the declared count.
        bool capped() const { return limit < declared; }

    private:
        const uint8_t* data;
        uint32_t declared;
        uint32_t limit;
        uint32_t index = 0;
        uint32_t skipped = 0;
    };

    class BinaryStlReader {
    public:
        /**
         * @brief Validates the preamble of a binary STL buffer and opens a stream on it
         *
         * At most min(declared, triangleCap) records are read.
         *
         * @throws ReadError Truncated if the buffer is shorter than the preamble or
         *         than the records that have to be read
         * @throws ReadError UnsupportedFormat if the buffer looks like ASCII STL,
         *         a ZIP archive or any other text file
         */
        static TriangleStream open(const void* data, std::size_t size, uint32_t triangleCap);

        static TriangleStream open(const std::string& buffer, uint32_t triangleCap) {
            return open(buffer.data(), buffer.size(), triangleCap);
        }

        static bool looksLikeAsciiStl(const uint8_t* data, std::size_t size, uint32_t declaredCount);

        // Name of a recognised non-STL format, or nullptr.
        static const char* foreignFormat(const uint8_t* data, std::size_t size);

        BinaryStlReader() = delete;
    };

} // namespace stlquote
