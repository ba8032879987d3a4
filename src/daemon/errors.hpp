#pragma once

#include <expected>
#include <string>
#include <string_view>

enum class ErrorKind {
    Validation,         // unsupported language/model, bad session id
    EngineConstruction, // engine could not be built or started
    EngineRuntime,      // feed/stop failure on a live engine
    Enrichment,         // LLM call or reply parsing failed
    Transport,          // sending to a client failed
    NotFound,           // unknown session id
    Protocol,           // malformed client message
};

struct Error {
    ErrorKind kind;
    std::string message;
};

// Failure to write one message to a client. `partial` means part of the
// frame reached the socket, so the stream can no longer be framed.
struct SendError {
    std::string message;
    bool partial = false;
};

inline std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::EngineConstruction: return "EngineConstructionError";
        case ErrorKind::EngineRuntime: return "EngineRuntimeError";
        case ErrorKind::Enrichment: return "EnrichmentError";
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Protocol: return "ProtocolError";
    }
    return "UnknownError";
}

inline std::unexpected<Error> make_error(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}
