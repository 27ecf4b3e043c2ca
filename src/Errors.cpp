#include "stlquote/Errors.hpp"

namespace stlquote {

    const char* toString(ReadError::Kind kind) {
        switch (kind) {
            case ReadError::Kind::Truncated:
                return "Truncated";
            case ReadError::Kind::UnsupportedFormat:
                return "UnsupportedFormat";
        }
        return "Unknown";
    }

    const char* toString(AnalysisError::Kind kind) {
        switch (kind) {
            case AnalysisError::Kind::EmptyOrUnparsableMesh:
                return "EmptyOrUnparsableMesh";
        }
        return "Unknown";
    }

} // namespace stlquote
