#include "stlquote/AnalysisService.hpp"
#include "stlquote/EnvironmentHandler.hpp"
#include "stlquote/Logger.hpp"
#include "stlquote/Server.hpp"
#include <exception>

int main() {
    try {
        auto& env = stlquote::EnvironmentHandler::instance();
        env.init();

        stlquote::AnalysisService service(env.getPrinterProfile(),
                                          env.getMaxUploadBytes(),
                                          env.getAllowedExtensions(),
                                          env.getFetchAllowedHosts());

        stlquote::Server server(service);
        server.start(env.getHost(), env.getPort(), env.getFetchTimeoutSeconds());
    } catch (const std::exception& e) {
        stlquote::Logger::error(std::string("Fatal: ") + e.what());
        return 1;
    }
    return 0;
}
