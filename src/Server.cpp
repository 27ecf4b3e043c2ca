#include "stlquote/Server.hpp"
#include "stlquote/Errors.hpp"
#include "stlquote/Logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <stdexcept>

using json = nlohmann::json;

namespace stlquote {

    namespace {
        // Headroom for multipart boundaries and the settings fields.
        constexpr std::size_t kMultipartOverhead = 64 * 1024;

        void reply(httplib::Response& res, const ServiceResponse& response) {
            res.status = response.status;
            res.set_content(response.body.dump(), "application/json");
        }

        bool formField(const httplib::Request& req, const std::string& name, std::string& out) {
            if (req.has_file(name)) {
                out = req.get_file_value(name).content;
                return true;
            }
            if (req.has_param(name)) {
                out = req.get_param_value(name);
                return true;
            }
            return false;
        }

        json settingsFromForm(const httplib::Request& req) {
            static const char* kFields[] = {"layerHeight", "infillPercentage", "wallThickness",
                                            "supportDensity", "materialType", "printQuality"};
            json fields = json::object();
            for (const char* name : kFields) {
                std::string value;
                if (formField(req, name, value)) {
                    fields[name] = value;
                }
            }
            return fields;
        }

        long long elapsedMs(std::chrono::steady_clock::time_point since) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - since).count();
        }
    }

    Server::Server(const AnalysisService& service) : service(service) {}

    std::string Server::fetch(const std::string& url, std::size_t maxBytes, int timeoutSeconds) {
        std::string origin;
        std::string path;
        if (!AnalysisService::splitUrl(url, origin, path)) {
            throw ValidationError("fileUrl", "Valid file URL is required");
        }

        Logger::info("Downloading STL from " + url);

        httplib::Client cli(origin);
        cli.set_connection_timeout(timeoutSeconds);
        cli.set_read_timeout(timeoutSeconds);
        // Redirects would sidestep the host allow list.
        cli.set_follow_location(false);

        std::string body;
        bool oversize = false;
        auto res = cli.Get(path, [&](const char* data, size_t length) {
            if (body.size() + length > maxBytes) {
                oversize = true;
                return false;
            }
            body.append(data, length);
            return true;
        });

        if (oversize) {
            throw std::runtime_error("Remote file exceeds the maximum size of " + std::to_string(maxBytes) +
                                     " bytes");
        }
        if (!res) {
            throw std::runtime_error("Failed to download file from URL: " + httplib::to_string(res.error()));
        }
        if (res->status != 200) {
            throw std::runtime_error("Failed to download file from URL, status " + std::to_string(res->status));
        }

        Logger::info("Downloaded " + std::to_string(body.size()) + " bytes from " + url);
        return body;
    }

    void Server::start(const std::string& host, int port, int fetchTimeoutSeconds) {
        httplib::Server svr;
        svr.set_payload_max_length(service.maxUploadBytes() + kMultipartOverhead);

        svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("{\"status\":\"healthy\",\"service\":\"stlquote\"}", "application/json");
        });

        svr.Post("/api/stl/analyze", [this](const httplib::Request& req, httplib::Response& res) {
            auto start_time = std::chrono::steady_clock::now();
            Logger::info("Received /api/stl/analyze POST request");

            if (!req.is_multipart_form_data() || !req.has_file("file")) {
                reply(res, AnalysisService::failure(400, "STL file is required"));
                return;
            }

            const auto& file = req.get_file_value("file");
            if (file.filename.empty()) {
                reply(res, AnalysisService::failure(400, "STL file is required"));
                return;
            }

            UploadInfo upload;
            upload.originalName = file.filename;
            upload.mimeType = file.content_type;

            reply(res, service.analyzeUpload(upload, file.content, settingsFromForm(req)));
            Logger::info("/api/stl/analyze answered " + std::to_string(res.status) + " in " +
                         std::to_string(elapsedMs(start_time)) + "ms");
        });

        svr.Post("/api/stl/analyze-url", [this, fetchTimeoutSeconds](const httplib::Request& req,
                                                                     httplib::Response& res) {
            auto start_time = std::chrono::steady_clock::now();
            Logger::info("Received /api/stl/analyze-url POST request");

            json body = json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.is_object()) {
                reply(res, AnalysisService::failure(400, "Request body must be a JSON object"));
                return;
            }

            auto urlField = body.find("fileUrl");
            if (urlField == body.end() || !urlField->is_string()) {
                reply(res, AnalysisService::failure(400, "Valid file URL is required"));
                return;
            }

            auto download = [fetchTimeoutSeconds](const std::string& url, std::size_t maxBytes) {
                return fetch(url, maxBytes, fetchTimeoutSeconds);
            };
            reply(res, service.analyzeUrl(urlField->get<std::string>(), body, download));
            Logger::info("/api/stl/analyze-url answered " + std::to_string(res.status) + " in " +
                         std::to_string(elapsedMs(start_time)) + "ms");
        });

        svr.Get("/api/stl/supported-formats", [this](const httplib::Request&, httplib::Response& res) {
            reply(res, service.supportedFormats());
        });

        svr.Get("/api/stl/printer-specs", [this](const httplib::Request&, httplib::Response& res) {
            reply(res, service.printerSpecs());
        });

        svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string message = "Internal server error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                message = e.what();
            } catch (...) {
                message = "Unknown error";
            }
            Logger::error("Unhandled error on " + req.path + ": " + message);
            reply(res, AnalysisService::failure(500, message));
        });

        svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
            if (res.status == 413) {
                reply(res, AnalysisService::failure(413, "File exceeds the maximum upload size"));
            } else if (res.status == 404) {
                reply(res, AnalysisService::failure(404, "Not found"));
            }
        });

        Logger::info("Server listening on " + host + ":" + std::to_string(port));
        if (!svr.listen(host, port)) {
            throw std::runtime_error("Failed to listen on " + host + ":" + std::to_string(port));
        }
    }

} // namespace stlquote
