#pragma once

#include <stdexcept>
#include <string>

namespace signer {

class SignerError : public std::runtime_error {
public:
    enum class ErrorType {
        InvalidEncoding,
        InvalidLength,
        InvalidChecksum,
        NetworkMismatch,
        InvalidPrivateKey,
        MalformedContainer,
        NoMatchingInput,
        EncodingFailure,
        CryptoFailure
    };

    SignerError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? default_message(type) : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    static std::string default_message(ErrorType type);

    ErrorType type_;
};

// Stable identifier for an error type, used in structured tool results
inline const char* error_type_name(SignerError::ErrorType type) {
    switch (type) {
        case SignerError::ErrorType::InvalidEncoding:    return "InvalidEncoding";
        case SignerError::ErrorType::InvalidLength:      return "InvalidLength";
        case SignerError::ErrorType::InvalidChecksum:    return "InvalidChecksum";
        case SignerError::ErrorType::NetworkMismatch:    return "NetworkMismatch";
        case SignerError::ErrorType::InvalidPrivateKey:  return "InvalidPrivateKey";
        case SignerError::ErrorType::MalformedContainer: return "MalformedContainer";
        case SignerError::ErrorType::NoMatchingInput:    return "NoMatchingInput";
        case SignerError::ErrorType::EncodingFailure:    return "EncodingFailure";
        case SignerError::ErrorType::CryptoFailure:      return "CryptoFailure";
    }
    return "Unknown";
}

inline std::string SignerError::default_message(ErrorType type) {
    return std::string("Signer error: ") + error_type_name(type);
}

} // namespace signer
