#include "stlquote/GeometryAccumulator.hpp"
#include "stlquote/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace stlquote {

    namespace {
        double distance(const Vertex& a, const Vertex& b) {
            double dx = static_cast<double>(b.x) - a.x;
            double dy = static_cast<double>(b.y) - a.y;
            double dz = static_cast<double>(b.z) - a.z;
            return std::sqrt(dx * dx + dy * dy + dz * dz);
        }

        float toFloat(double v) {
            return static_cast<float>(v);
        }
    }

    double heronArea(const Vertex& v1, const Vertex& v2, const Vertex& v3) {
        double a = distance(v1, v2);
        double b = distance(v1, v3);
        double c = distance(v2, v3);

        double s = (a + b + c) / 2.0;
        double radicand = s * (s - a) * (s - b) * (s - c);
        return std::sqrt(std::max(0.0, radicand));
    }

    double approximateUnsignedVolume(const Vertex& v1, const Vertex& v2, const Vertex& v3) {
        double ax = v1.x, ay = v1.y, az = v1.z;
        double bx = v2.x, by = v2.y, bz = v2.z;
        double cx = v3.x, cy = v3.y, cz = v3.z;

        // b × c
        double crossX = by * cz - bz * cy;
        double crossY = bz * cx - bx * cz;
        double crossZ = bx * cy - by * cx;

        double dot = ax * crossX + ay * crossY + az * crossZ;
        return std::abs(dot) / 6.0;
    }

    void GeometryAccumulator::extend(const Vertex& v) {
        minX = std::min(minX, static_cast<double>(v.x));
        minY = std::min(minY, static_cast<double>(v.y));
        minZ = std::min(minZ, static_cast<double>(v.z));
        maxX = std::max(maxX, static_cast<double>(v.x));
        maxY = std::max(maxY, static_cast<double>(v.y));
        maxZ = std::max(maxZ, static_cast<double>(v.z));
    }

    void GeometryAccumulator::add(const Triangle& tri) {
        extend(tri.v1);
        extend(tri.v2);
        extend(tri.v3);

        areaMm2 += heronArea(tri.v1, tri.v2, tri.v3);
        volumeMm3 += approximateUnsignedVolume(tri.v1, tri.v2, tri.v3);
        ++count;
    }

    MeshGeometry GeometryAccumulator::finish(uint32_t declaredCount, uint32_t parsedCount,
                                             uint32_t skippedCount, bool capped) const {
        MeshGeometry geometry;
        geometry.declaredTriangleCount = declaredCount;
        geometry.skippedTriangleCount = skippedCount;

        if (count == 0) {
            return geometry;
        }

        double scale = 1.0;
        if (capped && parsedCount > 0) {
            scale = static_cast<double>(declaredCount) / static_cast<double>(parsedCount);
            Logger::info("Extrapolating volume and area by factor " + std::to_string(scale) +
                         " (" + std::to_string(parsedCount) + " of " +
                         std::to_string(declaredCount) + " triangles read)");
        }

        geometry.triangleCount = count;
        geometry.extrapolationFactor = scale;
        geometry.volumeCm3 = volumeMm3 * scale / 1000.0;
        geometry.surfaceAreaCm2 = areaMm2 * scale / 100.0;

        geometry.boundingBox.min = Vertex{toFloat(minX), toFloat(minY), toFloat(minZ)};
        geometry.boundingBox.max = Vertex{toFloat(maxX), toFloat(maxY), toFloat(maxZ)};

        geometry.dimensionsCm.width = (maxX - minX) / 10.0;
        geometry.dimensionsCm.height = (maxY - minY) / 10.0;
        geometry.dimensionsCm.depth = (maxZ - minZ) / 10.0;

        return geometry;
    }

    MeshGeometry GeometryAccumulator::accumulate(TriangleStream& triangles) {
        GeometryAccumulator accumulator;
        Triangle tri;
        while (triangles.next(tri)) {
            accumulator.add(tri);
        }

        MeshGeometry geometry = accumulator.finish(triangles.declaredCount(), triangles.parsedCount(),
                                                   triangles.skippedCount(), triangles.capped());

        Logger::debug("Accumulated " + std::to_string(geometry.triangleCount) + " triangles: volume " +
                      std::to_string(geometry.volumeCm3) + " cm3, area " +
                      std::to_string(geometry.surfaceAreaCm2) + " cm2");
        return geometry;
    }

} // namespace stlquote
