#pragma once

#include <stdexcept>
#include <string>

namespace splice::engine {

    enum class ErrorKind {
        MalformedPatch,
        PathNotFound,
        PathExists,
        NoMatch,
        AmbiguousMatch,
        UnsafePath,
        IoError
    };

    inline const char* to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::MalformedPatch: return "MalformedPatch";
            case ErrorKind::PathNotFound:   return "PathNotFound";
            case ErrorKind::PathExists:     return "PathExists";
            case ErrorKind::NoMatch:        return "NoMatch";
            case ErrorKind::AmbiguousMatch: return "AmbiguousMatch";
            case ErrorKind::UnsafePath:     return "UnsafePath";
            case ErrorKind::IoError:        return "IoError";
        }
        return "Unknown";
    }

    /**
     * @brief Error raised by every engine stage.
     * The executor catches it per operation; only MalformedPatch aborts a run.
     */
    class PatchError : public std::runtime_error {
    public:
        PatchError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), m_kind(kind) {}

        ErrorKind kind() const { return m_kind; }

    private:
        ErrorKind m_kind;
    };

}
