#include "stlquote/PrintSettings.hpp"
#include "stlquote/Errors.hpp"
#include "stlquote/PrinterProfile.hpp"
#include <cmath>

namespace stlquote {

    namespace {
        constexpr double kMinWallThicknessMm = 0.4;
        constexpr double kMaxWallThicknessMm = 2.0;

        std::string formatRange(double lo, double hi) {
            std::string a = std::to_string(lo);
            std::string b = std::to_string(hi);
            a.erase(a.find_last_not_of('0') + 1);
            b.erase(b.find_last_not_of('0') + 1);
            if (!a.empty() && a.back() == '.') a.pop_back();
            if (!b.empty() && b.back() == '.') b.pop_back();
            return a + " and " + b;
        }
    }

    const char* toString(MaterialType material) {
        switch (material) {
            case MaterialType::PLA:  return "PLA";
            case MaterialType::PETG: return "PETG";
            case MaterialType::ABS:  return "ABS";
            case MaterialType::TPU:  return "TPU";
            case MaterialType::ASA:  return "ASA";
        }
        return "PLA";
    }

    const char* toString(PrintQuality quality) {
        switch (quality) {
            case PrintQuality::Draft:  return "draft";
            case PrintQuality::Normal: return "normal";
            case PrintQuality::High:   return "high";
        }
        return "normal";
    }

    bool parseMaterialType(const std::string& name, MaterialType& out) {
        for (MaterialType material : kAllMaterials) {
            if (name == toString(material)) {
                out = material;
                return true;
            }
        }
        return false;
    }

    bool parsePrintQuality(const std::string& name, PrintQuality& out) {
        for (PrintQuality quality : kAllQualities) {
            if (name == toString(quality)) {
                out = quality;
                return true;
            }
        }
        return false;
    }

    void validatePrintSettings(const PrintSettings& settings, const PrinterProfile& profile) {
        if (!std::isfinite(settings.layerHeightMm) ||
            settings.layerHeightMm < profile.minLayerHeightMm ||
            settings.layerHeightMm > profile.maxLayerHeightMm) {
            throw ValidationError("layerHeight", "Layer height must be between " +
                                                 formatRange(profile.minLayerHeightMm, profile.maxLayerHeightMm) +
                                                 " mm");
        }
        if (settings.infillPercentage > 100) {
            throw ValidationError("infillPercentage", "Infill percentage must be between 0 and 100");
        }
        if (!std::isfinite(settings.wallThicknessMm) ||
            settings.wallThicknessMm < kMinWallThicknessMm ||
            settings.wallThicknessMm > kMaxWallThicknessMm) {
            throw ValidationError("wallThickness", "Wall thickness must be between " +
                                                   formatRange(kMinWallThicknessMm, kMaxWallThicknessMm) +
                                                   " mm");
        }
        if (settings.supportDensity > 100) {
            throw ValidationError("supportDensity", "Support density must be between 0 and 100");
        }
    }

} // namespace stlquote
