#pragma once
#include <cstdint>

namespace stlquote {

    // Coordinates in millimetres, as stored in the source file.
    struct Vertex {
        float x = 0.0f;
        float y = 0.0f;
        float z = 0.0f;
    };

    // The STL facet normal and attribute bytes are not kept.
    struct Triangle {
        Vertex v1;
        Vertex v2;
        Vertex v3;
    };

    struct BoundingBox {
        Vertex min;
        Vertex max;
    };

    // width = X extent, height = Y extent, depth = Z extent.
    struct Dimensions {
        double width = 0.0;
        double height = 0.0;
        double depth = 0.0;
    };

    /**
     * @struct MeshGeometry
     * @brief Summary produced by a single pass of the geometry accumulator
     *
     * Volume and area are in cm³ / cm², dimensions in cm. The bounding box
     * stays in source units (mm). A geometry with triangleCount == 0 is the
     * empty sentinel: its bounding box is undefined and it must be rejected
     * by the caller.
     */
    struct MeshGeometry {
        double volumeCm3 = 0.0;
        double surfaceAreaCm2 = 0.0;
        Dimensions dimensionsCm;
        BoundingBox boundingBox;
        uint32_t triangleCount = 0;
        uint32_t declaredTriangleCount = 0;
        uint32_t skippedTriangleCount = 0;
        // declared / parsed when the reader capped the pass, 1 otherwise
        double extrapolationFactor = 1.0;

        bool empty() const { return triangleCount == 0; }
    };

} // namespace stlquote
