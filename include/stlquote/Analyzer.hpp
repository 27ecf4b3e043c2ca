#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "stlquote/Geometry.hpp"
#include "stlquote/PrintSettings.hpp"
#include "stlquote/PrinterProfile.hpp"

namespace stlquote {

    struct DisplayPoint {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
    };

    // Bounding box in cm.
    struct DisplayBoundingBox {
        DisplayPoint min;
        DisplayPoint max;
    };

    /**
     * @struct STLAnalysis
     * @brief Result of one analysis, in display units (cm, cm², cm³, hours, grams)
     */
    struct STLAnalysis {
        double volume = 0.0;
        Dimensions dimensions;
        double surfaceArea = 0.0;
        DisplayBoundingBox boundingBox;
        double estimatedPrintTimeHours = 0.0;
        double materialUsageGrams = 0.0;
        bool supportRequired = false;
        uint8_t printabilityScore = 0;
        uint32_t triangleCount = 0;
    };

    /**
     * @class Analyzer
     * @brief Runs reader, accumulator and estimator over one buffer
     *
     * Holds only the printer profile; analyze() is const and may be called
     * from several threads at once, each with its own buffer.
     */
    class Analyzer {
    public:
        explicit Analyzer(PrinterProfile profile);

        /**
         * @brief Analyses a binary STL buffer
         *
         * @throws ReadError if the buffer is truncated or not binary STL
         * @throws AnalysisError EmptyOrUnparsableMesh if no triangle could be used
         */
        STLAnalysis analyze(const void* data, std::size_t size, const PrintSettings& settings) const;

        STLAnalysis analyze(const std::string& buffer, const PrintSettings& settings) const {
            return analyze(buffer.data(), buffer.size(), settings);
        }

        const PrinterProfile& profile() const { return profile_; }

    private:
        PrinterProfile profile_;
    };

} // namespace stlquote
