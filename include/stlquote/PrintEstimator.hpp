#pragma once
#include <cstdint>
#include "stlquote/Geometry.hpp"
#include "stlquote/PrintSettings.hpp"
#include "stlquote/PrinterProfile.hpp"

namespace stlquote {

    struct PrintEstimate {
        double materialUsageGrams = 0.0;
        double printTimeHours = 0.0;
        uint8_t printabilityScore = 0;
        bool supportRequired = false;
    };

    // Feed rates in mm/s.
    struct PrintSpeeds {
        double perimeter = 0.0;
        double infill = 0.0;
        double support = 0.0;
    };

    /**
     * @class PrintEstimator
     * @brief Derives material, time, support and printability figures from bounding geometry
     *
     * Every figure is a coarse heuristic on the bounding box and the total
     * volume; no per-face analysis is done. Pure: the same geometry, settings
     * and profile always give the same estimate.
     */
    class PrintEstimator {
    public:
        // The profile is held by reference and must outlive the estimator.
        explicit PrintEstimator(const PrinterProfile& profile);
        PrintEstimator(PrinterProfile&&) = delete;

        PrintEstimate estimate(const MeshGeometry& geometry, const PrintSettings& settings) const;

        /**
         * @brief Support heuristic
         *
         * True if height / max(width, depth) exceeds the profile's support aspect
         * ratio, or if the estimated unsupported span is wider than twice the
         * overhang a layer can bridge at the profile's overhang angle. The span is
         * taken as width * (1 - volume / bounding volume), so a solid block has none.
         */
        bool requiresSupport(const MeshGeometry& geometry, const PrintSettings& settings) const;

        double materialUsageGrams(const MeshGeometry& geometry, const PrintSettings& settings,
                                  bool supportRequired) const;

        double printTimeHours(const MeshGeometry& geometry, const PrintSettings& settings,
                              bool supportRequired) const;

        // Shape risk only; material and quality play no part.
        uint8_t printabilityScore(const MeshGeometry& geometry) const;

        PrintSpeeds printSpeeds(const PrintSettings& settings) const;

        // Number of layers for the mesh height, 0 for a non-positive layer height.
        static uint32_t layerCount(double heightMm, double layerHeightMm);

    private:
        const PrinterProfile& profile;
    };

} // namespace stlquote
