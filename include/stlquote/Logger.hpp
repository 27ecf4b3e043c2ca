#pragma once
#include <string>

namespace stlquote {

    class Logger {
    public:
        enum class Level {
            Debug = 0,
            Info,
            Warn,
            Error
        };

        static void debug(const std::string& message);
        static void info(const std::string& message);
        static void warn(const std::string& message);
        static void error(const std::string& message);

        // Messages below this level are dropped. Defaults to Info.
        static void setLevel(Level level);
        static Level level();

        // Accepts debug, info, warn, error (case-insensitive).
        static bool parseLevel(const std::string& name, Level& out);
    };

} // namespace stlquote
