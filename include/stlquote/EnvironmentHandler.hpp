#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "stlquote/PrinterProfile.hpp"

namespace stlquote {

    /**
     * @class EnvironmentHandler
     * @brief Process-wide configuration, read from STLQUOTE_* variables once at startup
     */
    class EnvironmentHandler {
    public:
        static EnvironmentHandler& instance();

        /**
         * @brief Reads the environment and loads the printer profile
         *
         * @throws ConfigError on a malformed variable or profile file
         */
        void init();

        const std::string& getHost() const;
        int getPort() const;
        std::size_t getMaxUploadBytes() const;
        const std::vector<std::string>& getAllowedExtensions() const;
        const std::string& getPrinterProfilePath() const;
        // Empty unless STLQUOTE_FETCH_ALLOWED_HOSTS is set; empty turns URL analysis off.
        const std::vector<std::string>& getFetchAllowedHosts() const;
        int getFetchTimeoutSeconds() const;
        const PrinterProfile& getPrinterProfile() const;

    private:
        EnvironmentHandler() = default;

        std::string host = "0.0.0.0";
        int port = 8080;
        std::size_t maxUploadBytes = 50 * 1024 * 1024;
        std::vector<std::string> allowedExtensions = {".stl", ".obj", ".3mf"};
        std::string printerProfilePath;
        std::vector<std::string> fetchAllowedHosts;
        int fetchTimeoutSeconds = 30;
        PrinterProfile printerProfile = PrinterProfile::defaults();
    };

} // namespace stlquote
