#pragma once
#include <QtGlobal>

enum class ProviderKind : quint8 {
    Gemini, DeepSeek, Coze
};

enum class MessageRole : quint8 {
    User, Assistant, System
};

enum class ErrorKind : quint8 {
    ConnectionError,    // transport failure
    HttpError,          // provider answered with a non-success status
    MalformedChunk,     // one fragment failed to parse (skipped by decoders)
    SafetyBlocked,      // provider refused the content
    ProtocolViolation,  // unexpected message type or order
    Timeout,            // handshake or per-message deadline
    EmptyResult,        // nothing usable came back
    InvalidInput,       // caller error (key mismatch, unknown parameter, ...)
    Internal
};

enum class OutcomeStatus : quint8 {
    Completed, Degraded
};
