#include "stlquote/Analyzer.hpp"
#include "stlquote/Errors.hpp"
#include "stlquote/GeometryAccumulator.hpp"
#include "stlquote/Logger.hpp"
#include "stlquote/PrintEstimator.hpp"
#include "stlquote/STLReader.hpp"
#include <chrono>
#include <cmath>
#include <utility>

namespace stlquote {

    namespace {
        DisplayPoint toCm(const Vertex& v) {
            return DisplayPoint{v.x / 10.0, v.y / 10.0, v.z / 10.0};
        }

        // Last line of defence: no NaN or infinity leaves the engine.
        void sanitize(double& value, const char* field) {
            if (!std::isfinite(value)) {
                Logger::warn(std::string("Non-finite ") + field + " in analysis, reporting 0");
                value = 0.0;
            }
        }
    }

    Analyzer::Analyzer(PrinterProfile profile) : profile_(std::move(profile)) {}

    STLAnalysis Analyzer::analyze(const void* data, std::size_t size, const PrintSettings& settings) const {
        auto start_time = std::chrono::steady_clock::now();

        TriangleStream triangles = BinaryStlReader::open(data, size, profile_.triangleCap);
        MeshGeometry geometry = GeometryAccumulator::accumulate(triangles);

        if (geometry.empty()) {
            throw AnalysisError(AnalysisError::Kind::EmptyOrUnparsableMesh,
                                "No usable triangles in STL file (declared " +
                                std::to_string(geometry.declaredTriangleCount) + ", skipped " +
                                std::to_string(geometry.skippedTriangleCount) + ")");
        }

        PrintEstimator estimator(profile_);
        PrintEstimate estimate = estimator.estimate(geometry, settings);

        STLAnalysis analysis;
        analysis.volume = geometry.volumeCm3;
        analysis.dimensions = geometry.dimensionsCm;
        analysis.surfaceArea = geometry.surfaceAreaCm2;
        analysis.boundingBox.min = toCm(geometry.boundingBox.min);
        analysis.boundingBox.max = toCm(geometry.boundingBox.max);
        analysis.estimatedPrintTimeHours = estimate.printTimeHours;
        analysis.materialUsageGrams = estimate.materialUsageGrams;
        analysis.supportRequired = estimate.supportRequired;
        analysis.printabilityScore = estimate.printabilityScore;
        analysis.triangleCount = geometry.triangleCount;

        sanitize(analysis.volume, "volume");
        sanitize(analysis.surfaceArea, "surface area");
        sanitize(analysis.dimensions.width, "width");
        sanitize(analysis.dimensions.height, "height");
        sanitize(analysis.dimensions.depth, "depth");
        sanitize(analysis.boundingBox.min.x, "bounding box");
        sanitize(analysis.boundingBox.min.y, "bounding box");
        sanitize(analysis.boundingBox.min.z, "bounding box");
        sanitize(analysis.boundingBox.max.x, "bounding box");
        sanitize(analysis.boundingBox.max.y, "bounding box");
        sanitize(analysis.boundingBox.max.z, "bounding box");
        sanitize(analysis.estimatedPrintTimeHours, "print time");
        sanitize(analysis.materialUsageGrams, "material usage");

        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time).count();
        Logger::info("Analysed " + std::to_string(analysis.triangleCount) + " triangles in " +
                     std::to_string(elapsed_ms) + "ms: volume " + std::to_string(analysis.volume) +
                     " cm3, " + std::to_string(analysis.materialUsageGrams) + " g, " +
                     std::to_string(analysis.estimatedPrintTimeHours) + " h");
        return analysis;
    }

} // namespace stlquote
