#include "stlquote/AnalysisJson.hpp"
#include "stlquote/Errors.hpp"
#include <cmath>
#include <cstdlib>

using json = nlohmann::json;

namespace stlquote {

    namespace {
        double numberField(const json& j, const char* name) {
            auto it = j.find(name);
            if (it == j.end() || it->is_null()) {
                throw ValidationError(name, std::string(name) + " is required");
            }
            if (it->is_number()) {
                return it->get<double>();
            }
            if (it->is_string()) {
                const std::string& text = it->get_ref<const std::string&>();
                char* end = nullptr;
                double value = std::strtod(text.c_str(), &end);
                if (!text.empty() && end == text.c_str() + text.size() && std::isfinite(value)) {
                    return value;
                }
            }
            throw ValidationError(name, std::string(name) + " must be a number");
        }

        uint8_t percentField(const json& j, const char* name, const char* label) {
            double value = numberField(j, name);
            if (value < 0.0 || value > 100.0 || std::floor(value) != value) {
                throw ValidationError(name, std::string(label) + " must be between 0 and 100");
            }
            return static_cast<uint8_t>(value);
        }

        std::string stringField(const json& j, const char* name) {
            auto it = j.find(name);
            if (it == j.end() || !it->is_string()) {
                throw ValidationError(name, std::string(name) + " is required");
            }
            return it->get<std::string>();
        }

        template <typename T>
        void readIfPresent(const json& j, const char* key, T& field) {
            auto it = j.find(key);
            if (it != j.end() && !it->is_null()) {
                field = it->get<T>();
            }
        }

        MaterialType materialKey(const std::string& name) {
            MaterialType material;
            if (!parseMaterialType(name, material)) {
                throw ConfigError("Unknown material in printer profile: " + name);
            }
            return material;
        }

        PrintQuality qualityKey(const std::string& name) {
            PrintQuality quality;
            if (!parsePrintQuality(name, quality)) {
                throw ConfigError("Unknown print quality in printer profile: " + name);
            }
            return quality;
        }
    }

    void to_json(json& j, const Dimensions& d) {
        j = json{{"width", d.width}, {"height", d.height}, {"depth", d.depth}};
    }

    void to_json(json& j, const DisplayPoint& p) {
        j = json{{"x", p.x}, {"y", p.y}, {"z", p.z}};
    }

    void to_json(json& j, const DisplayBoundingBox& box) {
        j = json{{"min", box.min}, {"max", box.max}};
    }

    void to_json(json& j, const STLAnalysis& analysis) {
        j = json{
                {"volume", analysis.volume},
                {"dimensions", analysis.dimensions},
                {"surfaceArea", analysis.surfaceArea},
                {"boundingBox", analysis.boundingBox},
                {"estimatedPrintTime", analysis.estimatedPrintTimeHours},
                {"materialUsage", analysis.materialUsageGrams},
                {"supportRequired", analysis.supportRequired},
                {"printabilityScore", analysis.printabilityScore},
                {"triangleCount", analysis.triangleCount}
        };
    }

    void to_json(json& j, const PrintSettings& settings) {
        j = json{
                {"layerHeight", settings.layerHeightMm},
                {"infillPercentage", settings.infillPercentage},
                {"wallThickness", settings.wallThicknessMm},
                {"supportDensity", settings.supportDensity},
                {"materialType", toString(settings.materialType)},
                {"printQuality", toString(settings.printQuality)}
        };
    }

    void to_json(json& j, const PrinterProfile& profile) {
        json densities = json::object();
        for (const auto& entry : profile.materialDensities) {
            densities[toString(entry.first)] = entry.second;
        }
        json materialSpeeds = json::object();
        for (const auto& entry : profile.materialSpeedMultipliers) {
            materialSpeeds[toString(entry.first)] = entry.second;
        }
        json qualitySpeeds = json::object();
        for (const auto& entry : profile.qualitySpeedMultipliers) {
            qualitySpeeds[toString(entry.first)] = entry.second;
        }

        j = json{
                {"printer", profile.printerName},
                {"buildVolume", {{"x", profile.buildVolumeMm.x},
                                 {"y", profile.buildVolumeMm.y},
                                 {"z", profile.buildVolumeMm.z},
                                 {"unit", "mm"}}},
                {"layerHeight", {{"min", profile.minLayerHeightMm},
                                 {"max", profile.maxLayerHeightMm},
                                 {"unit", "mm"}}},
                {"nozzleDiameter", {{"value", profile.nozzleDiameterMm}, {"unit", "mm"}}},
                {"printSpeed", {{"max", profile.maxPrintSpeedMmS},
                                {"average", profile.averagePrintSpeedMmS},
                                {"unit", "mm/s"}}},
                {"materialDensities", densities},
                {"materialSpeedMultipliers", materialSpeeds},
                {"qualitySpeedMultipliers", qualitySpeeds},
                {"triangleCap", profile.triangleCap}
        };
    }

    PrintSettings parsePrintSettings(const json& j) {
        if (!j.is_object()) {
            throw ValidationError("body", "Print settings must be a JSON object");
        }

        PrintSettings settings;
        settings.layerHeightMm = numberField(j, "layerHeight");
        settings.infillPercentage = percentField(j, "infillPercentage", "Infill percentage");
        settings.wallThicknessMm = numberField(j, "wallThickness");
        settings.supportDensity = percentField(j, "supportDensity", "Support density");

        if (!parseMaterialType(stringField(j, "materialType"), settings.materialType)) {
            throw ValidationError("materialType", "Material type must be one of: PLA, PETG, ABS, TPU, ASA");
        }
        if (!parsePrintQuality(stringField(j, "printQuality"), settings.printQuality)) {
            throw ValidationError("printQuality", "Print quality must be one of: draft, normal, high");
        }
        return settings;
    }

    void applyProfileOverrides(const json& j, PrinterProfile& profile) {
        if (!j.is_object()) {
            throw ConfigError("Printer profile must be a JSON object");
        }

        readIfPresent(j, "printer", profile.printerName);
        if (auto it = j.find("buildVolume"); it != j.end()) {
            readIfPresent(*it, "x", profile.buildVolumeMm.x);
            readIfPresent(*it, "y", profile.buildVolumeMm.y);
            readIfPresent(*it, "z", profile.buildVolumeMm.z);
        }
        if (auto it = j.find("layerHeight"); it != j.end()) {
            readIfPresent(*it, "min", profile.minLayerHeightMm);
            readIfPresent(*it, "max", profile.maxLayerHeightMm);
        }
        if (auto it = j.find("nozzleDiameter"); it != j.end()) {
            readIfPresent(*it, "value", profile.nozzleDiameterMm);
        }
        if (auto it = j.find("printSpeed"); it != j.end()) {
            readIfPresent(*it, "max", profile.maxPrintSpeedMmS);
            readIfPresent(*it, "average", profile.averagePrintSpeedMmS);
        }
        if (auto it = j.find("materialDensities"); it != j.end()) {
            for (auto& entry : it->items()) {
                profile.materialDensities[materialKey(entry.key())] = entry.value().get<double>();
            }
        }
        if (auto it = j.find("materialSpeedMultipliers"); it != j.end()) {
            for (auto& entry : it->items()) {
                profile.materialSpeedMultipliers[materialKey(entry.key())] = entry.value().get<double>();
            }
        }
        if (auto it = j.find("qualitySpeedMultipliers"); it != j.end()) {
            for (auto& entry : it->items()) {
                profile.qualitySpeedMultipliers[qualityKey(entry.key())] = entry.value().get<double>();
            }
        }

        readIfPresent(j, "infillSpeedFactor", profile.infillSpeedFactor);
        readIfPresent(j, "supportSpeedFactor", profile.supportSpeedFactor);
        readIfPresent(j, "supportHeightFactor", profile.supportHeightFactor);
        readIfPresent(j, "brimWidth", profile.brimWidthMm);
        readIfPresent(j, "brimPasses", profile.brimPasses);
        readIfPresent(j, "layerChangeSeconds", profile.layerChangeSeconds);
        readIfPresent(j, "overheadFactor", profile.overheadFactor);
        readIfPresent(j, "maxOverhangAngle", profile.maxOverhangAngleDeg);
        readIfPresent(j, "thinFeatureThreshold", profile.thinFeatureThresholdMm);
        readIfPresent(j, "supportAspectRatio", profile.supportAspectRatio);
        readIfPresent(j, "unstableAspectRatio", profile.unstableAspectRatio);
        readIfPresent(j, "oversizePenalty", profile.oversizePenalty);
        readIfPresent(j, "thinFeaturePenalty", profile.thinFeaturePenalty);
        readIfPresent(j, "unstablePenalty", profile.unstablePenalty);
        readIfPresent(j, "triangleCap", profile.triangleCap);
    }

} // namespace stlquote
