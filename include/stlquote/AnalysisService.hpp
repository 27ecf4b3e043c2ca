#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "stlquote/Analyzer.hpp"
#include "stlquote/Errors.hpp"

namespace stlquote {

    struct ServiceResponse {
        int status = 200;
        nlohmann::json body;
    };

    struct UploadInfo {
        std::string originalName;
        std::string mimeType;
        // Set instead of originalName for files fetched from a URL.
        std::string url;
    };

    // Fetches url, refusing bodies larger than maxBytes.
    using Downloader = std::function<std::string(const std::string& url, std::size_t maxBytes)>;

    /**
     * @class AnalysisService
     * @brief Request-level handling around the analyzer: limits, validation and JSON replies
     *
     * Transport agnostic; the HTTP server only moves bytes in and out of it.
     * Every reply has the shape {"success": bool, "message": string, "data"?: object}.
     */
    class AnalysisService {
    public:
        /**
         * @param allowedFetchHosts Hosts analyzeUrl may download from; "*" allows any
         *        host and an empty list turns URL analysis off
         */
        AnalysisService(const PrinterProfile& profile,
                        std::size_t maxUploadBytes,
                        std::vector<std::string> allowedExtensions,
                        std::vector<std::string> allowedFetchHosts = {});

        /**
         * @brief Parses the print settings of a request and checks them against the profile
         *
         * @throws ValidationError naming the first bad field
         */
        PrintSettings readSettings(const nlohmann::json& settingsFields) const;

        /**
         * @brief Validates and analyses one uploaded file
         *
         * @param upload Name and MIME type of the file
         * @param content The file bytes
         * @param settingsFields Object holding the print setting fields
         * @return ServiceResponse 200 with the analysis, 400 invalid settings,
         *         413 too large, 415 unsupported type, 422 unreadable mesh
         */
        ServiceResponse analyzeUpload(const UploadInfo& upload,
                                      const std::string& content,
                                      const nlohmann::json& settingsFields) const;

        /**
         * @brief Downloads and analyses the file at url
         *
         * Settings and host are checked before anything is downloaded.
         *
         * @return ServiceResponse 400 invalid settings or URL, 403 host not allowed,
         *         502 download failed, otherwise as analyzeUpload
         */
        ServiceResponse analyzeUrl(const std::string& url,
                                   const nlohmann::json& settingsFields,
                                   const Downloader& download) const;

        ServiceResponse supportedFormats() const;
        ServiceResponse printerSpecs() const;

        // Lower-cased extension including the dot, empty if there is none.
        static std::string extensionOf(const std::string& filename);

        // Splits "scheme://host[:port]/path?query" into origin and path. Only http and https pass.
        static bool splitUrl(const std::string& url, std::string& origin, std::string& path);

        // Lower-cased host of an http(s) URL without user info or port, empty if the URL is invalid.
        static std::string hostOf(const std::string& url);

        static ServiceResponse failure(int status, const std::string& message);
        static ServiceResponse validationFailure(const ValidationError& error);

        std::size_t maxUploadBytes() const { return maxUploadBytes_; }

    private:
        ServiceResponse analyzeContent(const UploadInfo& upload,
                                       const std::string& content,
                                       const PrintSettings& settings) const;

        bool isAllowed(const std::string& extension) const;
        bool isFetchAllowed(const std::string& host) const;

        Analyzer analyzer;
        std::size_t maxUploadBytes_;
        std::vector<std::string> allowedExtensions;
        std::vector<std::string> allowedFetchHosts;
    };

} // namespace stlquote
