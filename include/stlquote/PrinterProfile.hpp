#pragma once
#include <cstdint>
#include <map>
#include <string>
#include "stlquote/PrintSettings.hpp"

namespace stlquote {

    struct BuildVolume {
        double x = 256.0;
        double y = 256.0;
        double z = 256.0;
    };

    /**
     * @struct PrinterProfile
     * @brief Printer and material constants read by the print estimator
     *
     * Built once at startup (defaults, optionally overridden from a JSON file)
     * and passed by const reference afterwards; nothing mutates it while
     * requests are being served.
     */
    struct PrinterProfile {
        std::string printerName = "Bambu Lab X1 Carbon";
        BuildVolume buildVolumeMm;
        double minLayerHeightMm = 0.05;
        double maxLayerHeightMm = 0.3;
        double nozzleDiameterMm = 0.4;
        double maxPrintSpeedMmS = 300.0;
        double averagePrintSpeedMmS = 60.0;

        // g/cm³
        std::map<MaterialType, double> materialDensities;
        std::map<MaterialType, double> materialSpeedMultipliers;
        std::map<PrintQuality, double> qualitySpeedMultipliers;

        double infillSpeedFactor = 1.2;
        double supportSpeedFactor = 1.5;
        double supportHeightFactor = 0.3;
        double brimWidthMm = 5.0;
        uint32_t brimPasses = 5;
        double layerChangeSeconds = 0.2;
        double overheadFactor = 1.10;
        double maxOverhangAngleDeg = 45.0;

        double thinFeatureThresholdMm = 5.0;
        double supportAspectRatio = 2.0;
        double unstableAspectRatio = 3.0;
        int oversizePenalty = 50;
        int thinFeaturePenalty = 20;
        int unstablePenalty = 15;

        // Records read per file before totals are extrapolated.
        uint32_t triangleCap = 5000;

        // Built-in profile of the shop's printer.
        static PrinterProfile defaults();

        /**
         * @brief Loads a profile from a JSON file, starting from defaults()
         *
         * Fields missing from the file keep their default value.
         *
         * @throws ConfigError if the file cannot be read or is not a valid profile
         */
        static PrinterProfile fromFile(const std::string& path);

        // Density for the material, PLA's when the table has no entry.
        double density(MaterialType material) const;
        // 1.0 when the table has no entry.
        double speedMultiplier(MaterialType material) const;
        double speedMultiplier(PrintQuality quality) const;
    };

} // namespace stlquote
