/**
 * @file    errors.hpp
 * @brief   Error types surfaced by the inpainting pipeline
 * @author  AllenK (Kwyshell)
 * @date    2026.09.02
 * @license MIT
 *
 * @details
 * Backend unavailability and backend failures never leave the engine; they
 * travel as BackendOutcome values and drive the fallback chain. Only the two
 * exceptions below reach callers.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace wit {

/**
 * Undecodable image or mask, unsupported channel layout, oversized upload
 */
class InvalidInputError : public std::runtime_error {
public:
    explicit InvalidInputError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * No backend, including the classical fallback, produced an image
 */
class AllBackendsExhaustedError : public std::runtime_error {
public:
    explicit AllBackendsExhaustedError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * Error category reported to the API layer
 */
enum class ErrorKind {
    None,
    InvalidInput,
    AllBackendsExhausted,
    Internal,               // Encoder or other unexpected failure
};

inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:                 return "none";
        case ErrorKind::InvalidInput:         return "invalid_input";
        case ErrorKind::AllBackendsExhausted: return "all_backends_exhausted";
        case ErrorKind::Internal:             return "internal";
    }
    return "unknown";
}

}  // namespace wit
