#include "stlquote/PrinterProfile.hpp"
#include "stlquote/AnalysisJson.hpp"
#include "stlquote/Errors.hpp"
#include "stlquote/Logger.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace stlquote {

    namespace {
        constexpr double kFallbackDensity = 1.24;
    }

    PrinterProfile PrinterProfile::defaults() {
        PrinterProfile profile;

        profile.materialDensities = {
                {MaterialType::PLA,  1.24},
                {MaterialType::PETG, 1.27},
                {MaterialType::ABS,  1.04},
                {MaterialType::TPU,  1.20},
                {MaterialType::ASA,  1.05},
        };

        // ASA has no entry and prints at the base speed.
        profile.materialSpeedMultipliers = {
                {MaterialType::PLA,  1.0},
                {MaterialType::PETG, 0.8},
                {MaterialType::ABS,  0.6},
                {MaterialType::TPU,  0.3},
        };

        profile.qualitySpeedMultipliers = {
                {PrintQuality::Draft,  1.5},
                {PrintQuality::Normal, 1.0},
                {PrintQuality::High,   0.7},
        };

        return profile;
    }

    PrinterProfile PrinterProfile::fromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            throw ConfigError("Unable to open printer profile: " + path);
        }

        PrinterProfile profile = defaults();
        try {
            nlohmann::json j = nlohmann::json::parse(file);
            applyProfileOverrides(j, profile);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Invalid printer profile " + path + ": " + e.what());
        }

        if (profile.minLayerHeightMm <= 0.0 || profile.maxLayerHeightMm < profile.minLayerHeightMm) {
            throw ConfigError("Invalid layer height limits in printer profile " + path);
        }
        if (profile.averagePrintSpeedMmS <= 0.0) {
            throw ConfigError("Average print speed must be positive in printer profile " + path);
        }
        if (profile.triangleCap == 0) {
            throw ConfigError("Triangle cap must be positive in printer profile " + path);
        }

        Logger::info("Loaded printer profile '" + profile.printerName + "' from " + path);
        return profile;
    }

    double PrinterProfile::density(MaterialType material) const {
        auto it = materialDensities.find(material);
        if (it != materialDensities.end()) {
            return it->second;
        }
        auto pla = materialDensities.find(MaterialType::PLA);
        return pla != materialDensities.end() ? pla->second : kFallbackDensity;
    }

    double PrinterProfile::speedMultiplier(MaterialType material) const {
        auto it = materialSpeedMultipliers.find(material);
        return it != materialSpeedMultipliers.end() ? it->second : 1.0;
    }

    double PrinterProfile::speedMultiplier(PrintQuality quality) const {
        auto it = qualitySpeedMultipliers.find(quality);
        return it != qualitySpeedMultipliers.end() ? it->second : 1.0;
    }

} // namespace stlquote
