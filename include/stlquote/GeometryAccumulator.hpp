#pragma once
#include <cstdint>
#include <limits>
#include "stlquote/Geometry.hpp"
#include "stlquote/STLReader.hpp"

namespace stlquote {

    /**
     * @brief Triangle area from its edge lengths (Heron's formula), in source units²
     *
     * The radicand is clamped at zero so near-degenerate triangles give 0
     * instead of NaN.
     */
    double heronArea(const Vertex& v1, const Vertex& v2, const Vertex& v3);

    /**
     * @brief Unsigned volume of the tetrahedron (origin, v1, v2, v3): |v1 · (v2 × v3)| / 6
     *
     * Summing these per triangle over-estimates the volume of non-convex or
     * open meshes. A signed divergence-theorem integrator would replace this.
     */
    double approximateUnsignedVolume(const Vertex& v1, const Vertex& v2, const Vertex& v3);

    class GeometryAccumulator {
    public:
        void add(const Triangle& tri);

        /**
         * @brief Produces the summary of everything added so far
         *
         * @param declaredCount Triangle count from the file header
         * @param parsedCount Usable records delivered by the reader
         * @param skippedCount Records the reader dropped
         * @param capped True if the reader stopped at its safety cap; volume and
         *        area are then scaled by declaredCount / parsedCount
         */
        MeshGeometry finish(uint32_t declaredCount, uint32_t parsedCount,
                            uint32_t skippedCount, bool capped) const;

        // Drains the stream in a single forward pass.
        static MeshGeometry accumulate(TriangleStream& triangles);

    private:
        void extend(const Vertex& v);

        double minX = std::numeric_limits<double>::infinity();
        double minY = std::numeric_limits<double>::infinity();
        double minZ = std::numeric_limits<double>::infinity();
        double maxX = -std::numeric_limits<double>::infinity();
        double maxY = -std::numeric_limits<double>::infinity();
        double maxZ = -std::numeric_limits<double>::infinity();
        double areaMm2 = 0.0;
        double volumeMm3 = 0.0;
        uint32_t count = 0;
    };

} // namespace stlquote
