#pragma once
#include <nlohmann/json.hpp>
#include "stlquote/Analyzer.hpp"
#include "stlquote/PrintSettings.hpp"
#include "stlquote/PrinterProfile.hpp"

namespace stlquote {

    void to_json(nlohmann::json& j, const Dimensions& d);
    void to_json(nlohmann::json& j, const DisplayPoint& p);
    void to_json(nlohmann::json& j, const DisplayBoundingBox& box);
    void to_json(nlohmann::json& j, const STLAnalysis& analysis);
    void to_json(nlohmann::json& j, const PrintSettings& settings);
    void to_json(nlohmann::json& j, const PrinterProfile& profile);

    /**
     * @brief Reads print settings from a request object
     *
     * Numeric fields may be JSON numbers or numeric strings (form fields arrive
     * as strings). Keys: layerHeight, infillPercentage, wallThickness,
     * supportDensity, materialType, printQuality.
     *
     * @throws ValidationError on a missing, malformed or out-of-range field
     */
    PrintSettings parsePrintSettings(const nlohmann::json& j);

    // Overwrites the profile fields present in j; others are left alone.
    void applyProfileOverrides(const nlohmann::json& j, PrinterProfile& profile);

} // namespace stlquote
