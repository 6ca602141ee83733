#pragma once

#include <stdexcept>
#include <string>

namespace semsearch {

    enum class ErrorKind {
        InvalidConfiguration,
        ModelUnavailable,
        EmptyInput,
        EmptyQuery,
        InvalidTopK,
        DimensionMismatch,
        IndexNotFound,
        BackendIOError,
        EmbeddingFailed,
        Timeout
    };

    inline const char* to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
            case ErrorKind::ModelUnavailable: return "ModelUnavailable";
            case ErrorKind::EmptyInput: return "EmptyInput";
            case ErrorKind::EmptyQuery: return "EmptyQuery";
            case ErrorKind::InvalidTopK: return "InvalidTopK";
            case ErrorKind::DimensionMismatch: return "DimensionMismatch";
            case ErrorKind::IndexNotFound: return "IndexNotFound";
            case ErrorKind::BackendIOError: return "BackendIOError";
            case ErrorKind::EmbeddingFailed: return "EmbeddingFailed";
            case ErrorKind::Timeout: return "Timeout";
        }
        return "Unknown";
    }

    /**
     * @brief Typed failure raised by every layer of the pipeline.
     */
    class Error : public std::runtime_error {
    public:
        Error(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), m_kind(kind) {}

        ErrorKind kind() const noexcept { return m_kind; }

    private:
        ErrorKind m_kind;
    };

}
