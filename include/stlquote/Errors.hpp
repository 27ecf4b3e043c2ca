#pragma once
#include <stdexcept>
#include <string>

namespace stlquote {

    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& message) : std::runtime_error(message) {}
    };

    /**
     * @class ReadError
     * @brief Raised by the binary STL reader when the buffer cannot be decoded
     */
    class ReadError : public Error {
    public:
        enum class Kind {
            Truncated,
            UnsupportedFormat
        };

        ReadError(Kind kind, const std::string& message)
                : Error(message), kind_(kind) {}

        Kind kind() const { return kind_; }

    private:
        Kind kind_;
    };

    class AnalysisError : public Error {
    public:
        enum class Kind {
            EmptyOrUnparsableMesh
        };

        AnalysisError(Kind kind, const std::string& message)
                : Error(message), kind_(kind) {}

        Kind kind() const { return kind_; }

    private:
        Kind kind_;
    };

    // Bad environment value or printer profile file.
    class ConfigError : public Error {
    public:
        explicit ConfigError(const std::string& message) : Error(message) {}
    };

    // Request field out of range. Only raised by the service layer.
    class ValidationError : public Error {
    public:
        ValidationError(const std::string& field, const std::string& message)
                : Error(message), field_(field) {}

        const std::string& field() const { return field_; }

    private:
        std::string field_;
    };

    const char* toString(ReadError::Kind kind);
    const char* toString(AnalysisError::Kind kind);

} // namespace stlquote
