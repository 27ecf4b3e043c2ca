#include "stlquote/EnvironmentHandler.hpp"
#include "stlquote/Errors.hpp"
#include "stlquote/Logger.hpp"
#include "stlquote/STLReader.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace stlquote {

    namespace {
        const char* env(const char* name) {
            const char* value = std::getenv(name);
            return (value && *value) ? value : nullptr;
        }

        unsigned long long parseUnsigned(const char* name, const char* text,
                                         unsigned long long lo, unsigned long long hi) {
            std::string s(text);
            if (s.find_first_not_of("0123456789") != std::string::npos) {
                throw ConfigError(std::string(name) + " must be a positive integer, got '" + s + "'");
            }
            errno = 0;
            unsigned long long value = std::strtoull(s.c_str(), nullptr, 10);
            if (errno == ERANGE || value < lo || value > hi) {
                throw ConfigError(std::string(name) + " out of range [" + std::to_string(lo) + ", " +
                                  std::to_string(hi) + "]: " + s);
            }
            return value;
        }

        // Comma separated, whitespace removed, lower-cased, empty items dropped.
        std::vector<std::string> parseList(const std::string& text) {
            std::vector<std::string> result;
            std::istringstream ss(text);
            std::string item;
            while (std::getline(ss, item, ',')) {
                item.erase(std::remove_if(item.begin(), item.end(),
                                          [](unsigned char c) { return std::isspace(c); }),
                           item.end());
                if (item.empty()) continue;
                std::transform(item.begin(), item.end(), item.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                result.push_back(item);
            }
            return result;
        }

        std::vector<std::string> parseExtensions(const std::string& text) {
            std::vector<std::string> result = parseList(text);
            for (auto& item : result) {
                if (item[0] != '.') item.insert(item.begin(), '.');
            }
            if (result.empty()) {
                throw ConfigError("STLQUOTE_ALLOWED_EXTENSIONS lists no extension");
            }
            return result;
        }
    }

    EnvironmentHandler& EnvironmentHandler::instance() {
        static EnvironmentHandler instance;
        return instance;
    }

    void EnvironmentHandler::init() {
        if (const char* level = env("STLQUOTE_LOG_LEVEL")) {
            Logger::Level parsed;
            if (!Logger::parseLevel(level, parsed)) {
                throw ConfigError(std::string("STLQUOTE_LOG_LEVEL must be debug, info, warn or error, got '") +
                                  level + "'");
            }
            Logger::setLevel(parsed);
        }

        if (const char* value = env("STLQUOTE_HOST")) {
            host = value;
        }
        if (const char* value = env("STLQUOTE_PORT")) {
            port = static_cast<int>(parseUnsigned("STLQUOTE_PORT", value, 1, 65535));
        }
        if (const char* value = env("STLQUOTE_MAX_UPLOAD_BYTES")) {
            maxUploadBytes = static_cast<std::size_t>(
                    parseUnsigned("STLQUOTE_MAX_UPLOAD_BYTES", value, kStlPreambleSize,
                                  std::numeric_limits<std::size_t>::max()));
        }
        if (const char* value = env("STLQUOTE_ALLOWED_EXTENSIONS")) {
            allowedExtensions = parseExtensions(value);
        }
        if (const char* value = env("STLQUOTE_FETCH_ALLOWED_HOSTS")) {
            fetchAllowedHosts = parseList(value);
        }
        if (const char* value = env("STLQUOTE_FETCH_TIMEOUT_S")) {
            fetchTimeoutSeconds = static_cast<int>(parseUnsigned("STLQUOTE_FETCH_TIMEOUT_S", value, 1, 3600));
        }

        const char* profilePath = env("STLQUOTE_PRINTER_PROFILE");
        printerProfilePath = profilePath ? profilePath : "";
        printerProfile = profilePath ? PrinterProfile::fromFile(profilePath) : PrinterProfile::defaults();

        if (const char* value = env("STLQUOTE_TRIANGLE_CAP")) {
            printerProfile.triangleCap = static_cast<uint32_t>(
                    parseUnsigned("STLQUOTE_TRIANGLE_CAP", value, 1, std::numeric_limits<uint32_t>::max()));
        }

        Logger::info("Configuration: listen " + host + ":" + std::to_string(port) +
                     ", max upload " + std::to_string(maxUploadBytes) + " bytes, URL downloads " +
                     (fetchAllowedHosts.empty() ? std::string("off") : std::string("on")) + ", printer '" +
                     printerProfile.printerName + "', triangle cap " +
                     std::to_string(printerProfile.triangleCap));
    }

    const std::string& EnvironmentHandler::getHost() const {
        return host;
    }

    int EnvironmentHandler::getPort() const {
        return port;
    }

    std::size_t EnvironmentHandler::getMaxUploadBytes() const {
        return maxUploadBytes;
    }

    const std::vector<std::string>& EnvironmentHandler::getAllowedExtensions() const {
        return allowedExtensions;
    }

    const std::string& EnvironmentHandler::getPrinterProfilePath() const {
        return printerProfilePath;
    }

    const std::vector<std::string>& EnvironmentHandler::getFetchAllowedHosts() const {
        return fetchAllowedHosts;
    }

    int EnvironmentHandler::getFetchTimeoutSeconds() const {
        return fetchTimeoutSeconds;
    }

    const PrinterProfile& EnvironmentHandler::getPrinterProfile() const {
        return printerProfile;
    }

} // namespace stlquote
