#include "nrating/core/model/Error.h"

#include <sstream>
#include <utility>

namespace nrating::core::model {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kFormat:
            return "FormatError";
        case ErrorKind::kValidation:
            return "ValidationError";
        case ErrorKind::kConfig:
            return "ConfigError";
        case ErrorKind::kIo:
            return "IoError";
    }
    return "Error";
}

std::string Error::ToString() const {
    std::ostringstream out;
    out << ErrorKindName(kind) << ": ";
    if (!path.empty()) {
        out << path;
        if (line > 0) {
            out << ':' << line;
        }
        out << ": ";
    }
    out << message;
    return out.str();
}

bool Fail(Error* error, ErrorKind kind, std::string message, std::string path, int line) {
    if (error) {
        error->kind = kind;
        error->message = std::move(message);
        error->path = std::move(path);
        error->line = line;
    }
    return false;
}

}  // namespace nrating::core::model
