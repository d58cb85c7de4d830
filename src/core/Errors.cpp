#include "core/Errors.hpp"

namespace rainsight {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:       return "validation";
        case ErrorKind::InsufficientData: return "insufficient_data";
        case ErrorKind::ArtifactLoad:     return "artifact_load";
        case ErrorKind::Provider:         return "provider";
        case ErrorKind::Capability:       return "capability";
        case ErrorKind::Transport:        return "transport";
        case ErrorKind::Persistence:      return "persistence";
        case ErrorKind::Unexpected:       return "unexpected";
    }
    return "unknown";
}

} // namespace rainsight
