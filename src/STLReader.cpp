#include "stlquote/STLReader.hpp"
#include "stlquote/Errors.hpp"
#include "stlquote/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstring>

namespace stlquote {

    namespace {
        // Byte order of the file is little-endian regardless of the host.
        uint32_t readU32LE(const uint8_t* p) {
            return static_cast<uint32_t>(p[0]) |
                   (static_cast<uint32_t>(p[1]) << 8) |
                   (static_cast<uint32_t>(p[2]) << 16) |
                   (static_cast<uint32_t>(p[3]) << 24);
        }

        float readF32LE(const uint8_t* p) {
            uint32_t bits = readU32LE(p);
            float value;
            std::memcpy(&value, &bits, sizeof(value));
            return value;
        }

        Vertex readVertex(const uint8_t* p) {
            Vertex v;
            v.x = readF32LE(p);
            v.y = readF32LE(p + 4);
            v.z = readF32LE(p + 8);
            return v;
        }

        bool isFinite(const Vertex& v) {
            return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
        }

        // Only the start of the body is scanned for ASCII keywords.
        constexpr std::size_t kAsciiProbeBytes = 4096;

        // Preamble plus the first few records. Binary count and record bytes
        // always hold something outside printable ASCII within this window.
        constexpr std::size_t kTextProbeBytes = kStlPreambleSize + 8 * kStlRecordSize;

        const uint8_t kZipMagic[] = {'P', 'K', 0x03, 0x04};

        bool isTextByte(uint8_t c) {
            return (c >= 0x20 && c < 0x7F) || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }
    }

    TriangleStream::TriangleStream(const uint8_t* records, uint32_t declaredCount, uint32_t parseLimit)
            : data(records), declared(declaredCount), limit(parseLimit) {}

    bool TriangleStream::next(Triangle& out) {
        while (index < limit) {
            const uint8_t* record = data + static_cast<std::size_t>(index) * kStlRecordSize;
            ++index;

            Triangle tri;
            tri.v1 = readVertex(record + offsetof(STLTriangleRaw, vertex1));
            tri.v2 = readVertex(record + offsetof(STLTriangleRaw, vertex2));
            tri.v3 = readVertex(record + offsetof(STLTriangleRaw, vertex3));

            if (!isFinite(tri.v1) || !isFinite(tri.v2) || !isFinite(tri.v3)) {
                ++skipped;
                Logger::warn("Non-finite vertex in triangle " + std::to_string(index - 1) + ", skipping");
                continue;
            }

            out = tri;
            return true;
        }
        return false;
    }

    bool BinaryStlReader::looksLikeAsciiStl(const uint8_t* data, std::size_t size, uint32_t declaredCount) {
        static const char kSolid[] = "solid";
        static const char kFacet[] = "facet";

        std::size_t start = 0;
        while (start < size && std::isspace(static_cast<unsigned char>(data[start]))) {
            ++start;
        }
        if (size - start < sizeof(kSolid) - 1 ||
            std::memcmp(data + start, kSolid, sizeof(kSolid) - 1) != 0) {
            return false;
        }

        // Binary exporters often write "solid" into the header too; a size that
        // matches the declared record count settles it.
        uint64_t binarySize = kStlPreambleSize + static_cast<uint64_t>(declaredCount) * kStlRecordSize;
        if (binarySize == size) {
            return false;
        }

        std::size_t probe = std::min(size, kAsciiProbeBytes);
        const uint8_t* end = data + probe;
        const uint8_t* hit = std::search(data, end, kFacet, kFacet + sizeof(kFacet) - 1);
        return hit != end;
    }

    const char* BinaryStlReader::foreignFormat(const uint8_t* data, std::size_t size) {
        if (size >= sizeof(kZipMagic) && std::memcmp(data, kZipMagic, sizeof(kZipMagic)) == 0) {
            return "ZIP archive (3MF)";
        }
        std::size_t probe = std::min(size, kTextProbeBytes);
        if (probe > 0 && std::all_of(data, data + probe, isTextByte)) {
            return "text file (OBJ or other)";
        }
        return nullptr;
    }

    TriangleStream BinaryStlReader::open(const void* fileData, std::size_t size, uint32_t triangleCap) {
        const uint8_t* data = static_cast<const uint8_t*>(fileData);

        if (data == nullptr || size < kStlPreambleSize) {
            throw ReadError(ReadError::Kind::Truncated,
                            "STL file too small: " + std::to_string(size) + " bytes, header needs " +
                            std::to_string(kStlPreambleSize));
        }

        uint32_t declared = readU32LE(data + kStlHeaderSize);

        if (looksLikeAsciiStl(data, size, declared)) {
            throw ReadError(ReadError::Kind::UnsupportedFormat,
                            "ASCII STL is not supported, upload a binary STL");
        }
        if (const char* format = foreignFormat(data, size)) {
            throw ReadError(ReadError::Kind::UnsupportedFormat,
                            std::string("Not a binary STL file: looks like a ") + format);
        }

        uint32_t limit = std::min(declared, triangleCap);
        uint64_t required = kStlPreambleSize + static_cast<uint64_t>(limit) * kStlRecordSize;
        if (size < required) {
            throw ReadError(ReadError::Kind::Truncated,
                            "STL file truncated. Expected " + std::to_string(required) +
                            " bytes, got " + std::to_string(size));
        }

        Logger::debug("Binary STL declares " + std::to_string(declared) + " triangles, reading " +
                      std::to_string(limit));
        if (limit < declared) {
            Logger::warn("Triangle count " + std::to_string(declared) + " exceeds cap of " +
                         std::to_string(triangleCap) + ", totals will be extrapolated");
        }

        return TriangleStream(data + kStlPreambleSize, declared, limit);
    }

} // namespace stlquote
