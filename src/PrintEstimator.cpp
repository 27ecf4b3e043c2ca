#include "stlquote/PrintEstimator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace stlquote {

    namespace {
        constexpr double kPi = 3.14159265358979323846;

        double perimeterCm(const Dimensions& d) {
            return 2.0 * (d.width + d.depth);
        }

        // height / max(width, depth); infinity for a footprint of zero width and depth.
        double aspectRatio(const Dimensions& d) {
            double base = std::max(d.width, d.depth);
            if (base <= 0.0) {
                return d.height > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
            }
            return d.height / base;
        }

        double safeDivide(double numerator, double denominator) {
            if (denominator <= 0.0 || !std::isfinite(denominator)) {
                return 0.0;
            }
            return numerator / denominator;
        }

        double finiteOrZero(double value) {
            return std::isfinite(value) ? value : 0.0;
        }
    }

    PrintEstimator::PrintEstimator(const PrinterProfile& profile) : profile(profile) {}

    PrintEstimate PrintEstimator::estimate(const MeshGeometry& geometry, const PrintSettings& settings) const {
        PrintEstimate result;
        result.supportRequired = requiresSupport(geometry, settings);
        result.materialUsageGrams = materialUsageGrams(geometry, settings, result.supportRequired);
        result.printTimeHours = printTimeHours(geometry, settings, result.supportRequired);
        result.printabilityScore = printabilityScore(geometry);
        return result;
    }

    bool PrintEstimator::requiresSupport(const MeshGeometry& geometry, const PrintSettings& settings) const {
        const Dimensions& d = geometry.dimensionsCm;

        if (aspectRatio(d) > profile.supportAspectRatio) {
            return true;
        }

        double layerHeightMm = std::max(0.0, settings.layerHeightMm);
        double maxOverhangMm = layerHeightMm / std::tan(profile.maxOverhangAngleDeg * kPi / 180.0);

        double boundingVolume = d.width * d.height * d.depth;
        double fill = std::min(1.0, safeDivide(geometry.volumeCm3, boundingVolume));
        double unsupportedSpanMm = d.width * 10.0 * (1.0 - fill);

        return unsupportedSpanMm > maxOverhangMm * 2.0;
    }

    double PrintEstimator::materialUsageGrams(const MeshGeometry& geometry, const PrintSettings& settings,
                                              bool supportRequired) const {
        const Dimensions& d = geometry.dimensionsCm;
        double perimeter = perimeterCm(d);

        double wallVolume = perimeter * d.height * (settings.wallThicknessMm / 10.0);

        double internalVolume = std::max(0.0, geometry.volumeCm3 - wallVolume);
        double infillVolume = internalVolume * (settings.infillPercentage / 100.0);

        double supportVolume = 0.0;
        if (supportRequired) {
            double baseArea = d.width * d.depth;
            double supportHeight = d.height * profile.supportHeightFactor;
            supportVolume = baseArea * supportHeight * (settings.supportDensity / 100.0);
        }

        double brimVolume = perimeter * (profile.brimWidthMm / 10.0) * (settings.layerHeightMm / 10.0);

        double total = wallVolume + infillVolume + supportVolume + brimVolume;
        return finiteOrZero(std::max(0.0, total * profile.density(settings.materialType)));
    }

    PrintSpeeds PrintEstimator::printSpeeds(const PrintSettings& settings) const {
        double multiplier = profile.speedMultiplier(settings.printQuality) *
                            profile.speedMultiplier(settings.materialType);

        PrintSpeeds speeds;
        speeds.perimeter = profile.averagePrintSpeedMmS * multiplier;
        speeds.infill = speeds.perimeter * profile.infillSpeedFactor;
        speeds.support = speeds.perimeter * profile.supportSpeedFactor;
        return speeds;
    }

    uint32_t PrintEstimator::layerCount(double heightMm, double layerHeightMm) {
        if (!(layerHeightMm > 0.0) || !(heightMm > 0.0)) {
            return 0;
        }
        double layers = std::ceil(heightMm / layerHeightMm);
        if (!std::isfinite(layers) || layers > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
            return std::numeric_limits<uint32_t>::max();
        }
        return static_cast<uint32_t>(layers);
    }

    double PrintEstimator::printTimeHours(const MeshGeometry& geometry, const PrintSettings& settings,
                                          bool supportRequired) const {
        const Dimensions& d = geometry.dimensionsCm;
        double layers = layerCount(d.height * 10.0, settings.layerHeightMm);
        PrintSpeeds speeds = printSpeeds(settings);

        double perimeterLengthMm = perimeterCm(d) * 10.0;
        double perimeterTime = safeDivide(perimeterLengthMm * layers, speeds.perimeter);

        double infillAreaMm2 = d.width * d.depth * 100.0;
        double infillTime = safeDivide(infillAreaMm2 * layers * settings.infillPercentage / 100.0,
                                       speeds.infill);

        double supportTime = supportRequired
                             ? safeDivide(infillAreaMm2 * layers * profile.supportHeightFactor, speeds.support)
                             : 0.0;

        double brimTime = safeDivide(perimeterLengthMm * profile.brimPasses, speeds.perimeter);
        double layerChangeTime = layers * profile.layerChangeSeconds;

        double totalSeconds = (perimeterTime + infillTime + supportTime + brimTime + layerChangeTime) *
                              profile.overheadFactor;
        return finiteOrZero(std::max(0.0, totalSeconds / 3600.0));
    }

    uint8_t PrintEstimator::printabilityScore(const MeshGeometry& geometry) const {
        const Dimensions& d = geometry.dimensionsCm;
        int score = 100;

        const BuildVolume& build = profile.buildVolumeMm;
        if (d.width * 10.0 > build.x || d.height * 10.0 > build.y || d.depth * 10.0 > build.z) {
            score -= profile.oversizePenalty;
        }

        double smallestMm = std::min({d.width, d.height, d.depth}) * 10.0;
        if (smallestMm < profile.thinFeatureThresholdMm) {
            score -= profile.thinFeaturePenalty;
        }

        if (aspectRatio(d) > profile.unstableAspectRatio) {
            score -= profile.unstablePenalty;
        }

        return static_cast<uint8_t>(std::clamp(score, 0, 100));
    }

} // namespace stlquote
