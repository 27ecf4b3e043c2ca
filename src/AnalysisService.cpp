#include "stlquote/AnalysisService.hpp"
#include "stlquote/AnalysisJson.hpp"
#include "stlquote/Errors.hpp"
#include "stlquote/Hasher.hpp"
#include "stlquote/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

using json = nlohmann::json;

namespace stlquote {

    namespace {
        std::string megabytes(std::size_t bytes) {
            return std::to_string(bytes / (1024 * 1024)) + "MB";
        }

        std::string joined(const std::vector<std::string>& items) {
            std::string out;
            for (const auto& item : items) {
                if (!out.empty()) out += ", ";
                out += item;
            }
            return out;
        }
    }

    AnalysisService::AnalysisService(const PrinterProfile& profile,
                                     std::size_t maxUploadBytes,
                                     std::vector<std::string> allowedExtensions,
                                     std::vector<std::string> allowedFetchHosts)
            : analyzer(profile),
              maxUploadBytes_(maxUploadBytes),
              allowedExtensions(std::move(allowedExtensions)),
              allowedFetchHosts(std::move(allowedFetchHosts)) {}

    std::string AnalysisService::extensionOf(const std::string& filename) {
        std::size_t slash = filename.find_last_of("/\\");
        std::size_t dot = filename.find_last_of('.');
        if (dot == std::string::npos || (slash != std::string::npos && dot < slash) ||
            dot + 1 == filename.size()) {
            return "";
        }
        std::string ext = filename.substr(dot);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

    bool AnalysisService::splitUrl(const std::string& url, std::string& origin, std::string& path) {
        std::size_t schemeEnd = url.find("://");
        if (schemeEnd == std::string::npos) {
            return false;
        }
        std::string scheme = url.substr(0, schemeEnd);
        if (scheme != "http" && scheme != "https") {
            return false;
        }
        std::size_t pathStart = url.find('/', schemeEnd + 3);
        origin = url.substr(0, pathStart);
        path = pathStart == std::string::npos ? "/" : url.substr(pathStart);
        return origin.size() > schemeEnd + 3;
    }

    std::string AnalysisService::hostOf(const std::string& url) {
        std::string origin;
        std::string path;
        if (!splitUrl(url, origin, path)) {
            return "";
        }

        std::string authority = origin.substr(origin.find("://") + 3);
        std::size_t at = authority.rfind('@');
        if (at != std::string::npos) {
            authority.erase(0, at + 1);
        }

        std::string host;
        if (!authority.empty() && authority[0] == '[') {
            std::size_t close = authority.find(']');
            if (close == std::string::npos) {
                return "";
            }
            host = authority.substr(0, close + 1);
        } else {
            host = authority.substr(0, authority.find(':'));
        }
        std::transform(host.begin(), host.end(), host.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return host;
    }

    ServiceResponse AnalysisService::failure(int status, const std::string& message) {
        return ServiceResponse{status, json{{"success", false}, {"message", message}}};
    }

    ServiceResponse AnalysisService::validationFailure(const ValidationError& error) {
        ServiceResponse response = failure(400, "Validation failed");
        response.body["errors"] = json::array({json{{"field", error.field()}, {"message", error.what()}}});
        return response;
    }

    bool AnalysisService::isAllowed(const std::string& extension) const {
        return std::find(allowedExtensions.begin(), allowedExtensions.end(), extension) !=
               allowedExtensions.end();
    }

    bool AnalysisService::isFetchAllowed(const std::string& host) const {
        for (const auto& allowed : allowedFetchHosts) {
            if (allowed == "*" || allowed == host) {
                return true;
            }
        }
        return false;
    }

    PrintSettings AnalysisService::readSettings(const json& settingsFields) const {
        PrintSettings settings = parsePrintSettings(settingsFields);
        validatePrintSettings(settings, analyzer.profile());
        return settings;
    }

    ServiceResponse AnalysisService::analyzeUpload(const UploadInfo& upload,
                                                   const std::string& content,
                                                   const json& settingsFields) const {
        if (content.size() > maxUploadBytes_) {
            Logger::warn("Rejected " + upload.originalName + ": " + std::to_string(content.size()) + " bytes");
            return failure(413, "File exceeds the maximum size of " + megabytes(maxUploadBytes_));
        }

        std::string ext = extensionOf(upload.originalName);
        if (!isAllowed(ext)) {
            return failure(415, "File type " + (ext.empty() ? std::string("(none)") : ext) +
                                " not allowed. Allowed types: " + joined(allowedExtensions));
        }
        if (ext != ".stl") {
            return failure(415, "Only binary STL files can be analysed, " + ext + " is not supported");
        }

        PrintSettings settings;
        try {
            settings = readSettings(settingsFields);
        } catch (const ValidationError& e) {
            Logger::warn("Invalid print settings for " + upload.originalName + ": " + e.what());
            return validationFailure(e);
        }
        return analyzeContent(upload, content, settings);
    }

    ServiceResponse AnalysisService::analyzeUrl(const std::string& url,
                                                const json& settingsFields,
                                                const Downloader& download) const {
        PrintSettings settings;
        try {
            settings = readSettings(settingsFields);
        } catch (const ValidationError& e) {
            Logger::warn("Invalid print settings for " + url + ": " + e.what());
            return validationFailure(e);
        }

        std::string host = hostOf(url);
        if (host.empty()) {
            return validationFailure(ValidationError("fileUrl", "Valid file URL is required"));
        }
        if (!isFetchAllowed(host)) {
            Logger::warn("Refused download from " + host);
            return failure(403, "Downloads from " + host + " are not allowed");
        }

        std::string content;
        try {
            content = download(url, maxUploadBytes_);
        } catch (const ValidationError& e) {
            return validationFailure(e);
        } catch (const std::exception& e) {
            Logger::error("Download of " + url + " failed: " + e.what());
            return failure(502, e.what());
        }

        if (content.size() > maxUploadBytes_) {
            Logger::warn("Rejected " + url + ": " + std::to_string(content.size()) + " bytes");
            return failure(413, "File exceeds the maximum size of " + megabytes(maxUploadBytes_));
        }

        // Fetched files are assumed to be STL whatever the URL looks like.
        UploadInfo upload;
        upload.url = url;
        return analyzeContent(upload, content, settings);
    }

    ServiceResponse AnalysisService::analyzeContent(const UploadInfo& upload,
                                                    const std::string& content,
                                                    const PrintSettings& settings) const {
        const std::string& source = upload.url.empty() ? upload.originalName : upload.url;

        try {
            STLAnalysis analysis = analyzer.analyze(content, settings);

            json fileInfo;
            if (upload.url.empty()) {
                fileInfo = json{{"originalName", upload.originalName},
                                {"size", content.size()},
                                {"mimeType", upload.mimeType}};
            } else {
                fileInfo = json{{"url", upload.url}, {"size", content.size()}};
            }
            fileInfo["sha256"] = Hasher::sha256(content);

            return ServiceResponse{200, json{
                    {"success", true},
                    {"message", "STL analysis completed successfully"},
                    {"data", {{"analysis", analysis},
                              {"printSettings", settings},
                              {"fileInfo", fileInfo}}}
            }};
        } catch (const ReadError& e) {
            Logger::warn(std::string("Unreadable STL ") + source + " (" + toString(e.kind()) + "): " + e.what());
            return failure(422, e.what());
        } catch (const AnalysisError& e) {
            Logger::warn(std::string("Analysis failed for ") + source + " (" + toString(e.kind()) + "): " +
                         e.what());
            return failure(422, e.what());
        }
    }

    ServiceResponse AnalysisService::supportedFormats() const {
        static const json kFormats = json::array({
                {{"extension", ".stl"},
                 {"name", "STL (Stereolithography)"},
                 {"description", "Binary STL, the only format analysed"}},
                {{"extension", ".obj"},
                 {"name", "OBJ (Wavefront OBJ)"},
                 {"description", "Accepted for upload, not analysed"}},
                {{"extension", ".3mf"},
                 {"name", "3MF (3D Manufacturing Format)"},
                 {"description", "Accepted for upload, not analysed"}}
        });

        json formats = json::array();
        for (const auto& format : kFormats) {
            if (isAllowed(format["extension"].get<std::string>())) {
                json entry = format;
                entry["maxSize"] = megabytes(maxUploadBytes_);
                formats.push_back(entry);
            }
        }

        json materials = json::array();
        for (MaterialType material : kAllMaterials) {
            materials.push_back(toString(material));
        }
        json qualities = json::array();
        for (PrintQuality quality : kAllQualities) {
            qualities.push_back(toString(quality));
        }

        return ServiceResponse{200, json{
                {"success", true},
                {"data", {{"formats", formats},
                          {"maxFileSize", megabytes(maxUploadBytes_)},
                          {"supportedMaterials", materials},
                          {"printQualities", qualities}}}
        }};
    }

    ServiceResponse AnalysisService::printerSpecs() const {
        return ServiceResponse{200, json{{"success", true}, {"data", analyzer.profile()}}};
    }

} // namespace stlquote
