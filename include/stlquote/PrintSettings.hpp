#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace stlquote {

    enum class MaterialType {
        PLA,
        PETG,
        ABS,
        TPU,
        ASA
    };

    enum class PrintQuality {
        Draft,
        Normal,
        High
    };

    constexpr std::array<MaterialType, 5> kAllMaterials = {
            MaterialType::PLA, MaterialType::PETG, MaterialType::ABS, MaterialType::TPU, MaterialType::ASA};

    constexpr std::array<PrintQuality, 3> kAllQualities = {
            PrintQuality::Draft, PrintQuality::Normal, PrintQuality::High};

    const char* toString(MaterialType material);
    const char* toString(PrintQuality quality);

    // Exact, case-sensitive names ("PLA", "draft"). Return false on unknown names.
    bool parseMaterialType(const std::string& name, MaterialType& out);
    bool parsePrintQuality(const std::string& name, PrintQuality& out);

    /**
     * @struct PrintSettings
     * @brief Slicer settings chosen by the customer
     *
     * The engine trusts these values; range checks belong to the caller
     * (see validatePrintSettings).
     */
    struct PrintSettings {
        double layerHeightMm = 0.0;
        uint8_t infillPercentage = 0;
        double wallThicknessMm = 0.0;
        uint8_t supportDensity = 0;
        MaterialType materialType = MaterialType::PLA;
        PrintQuality printQuality = PrintQuality::Normal;
    };

    struct PrinterProfile;

    /**
     * @brief Range checks applied to settings coming from a request
     *
     * Layer height must lie within the profile's limits, wall thickness within
     * 0.4..2.0 mm, infill and support density within 0..100.
     *
     * @throws ValidationError naming the offending field
     */
    void validatePrintSettings(const PrintSettings& settings, const PrinterProfile& profile);

} // namespace stlquote
