#pragma once
#include <string>
#include "stlquote/AnalysisService.hpp"

namespace stlquote {

    class Server {
    public:
        explicit Server(const AnalysisService& service);

        // Blocks serving requests until the listener stops.
        void start(const std::string& host, int port, int fetchTimeoutSeconds);

        /**
         * @brief Downloads a file over HTTP(S), refusing bodies larger than maxBytes
         *
         * @throws ValidationError if the URL is not an http(s) URL
         * @throws std::runtime_error on connection failure, non-200 status (redirects included)
         *         or oversize body
         */
        static std::string fetch(const std::string& url, std::size_t maxBytes, int timeoutSeconds);

    private:
        const AnalysisService& service;
    };

} // namespace stlquote
