#pragma once

#include <string>

namespace nrating::core::model {

enum class ErrorKind {
    kFormat,
    kValidation,
    kConfig,
    kIo,
};

struct Error {
    ErrorKind kind = ErrorKind::kValidation;
    std::string message;
    std::string path;
    int line = 0;

    std::string ToString() const;
};

const char* ErrorKindName(ErrorKind kind);

// Fills *error when non-null and returns false, so call sites can write
// `return Fail(error, ...);`.
bool Fail(Error* error, ErrorKind kind, std::string message, std::string path = {}, int line = 0);

}  // namespace nrating::core::model
