#pragma once

#include "core/answer/fragment_stream.h"

#include <QString>

#include <optional>
#include <stdexcept>
#include <string>

namespace cr {

// Raised by generation capabilities for transport, timeout or provider
// failures. status carries the provider's HTTP-like status when known.
class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& message,
                             std::optional<int> status = std::nullopt);

    std::optional<int> status() const;

    // Unknown status and 500/502/503/504 are worth retrying.
    bool isRetryable() const;

private:
    std::optional<int> m_status;
};

// Borrowed capability wrapping the language model.
class GenerationProvider {
public:
    virtual ~GenerationProvider() = default;

    // Throws GenerationError on failure.
    virtual QString complete(const QString& systemInstruction, const QString& prompt) = 0;

    // The returned stream may throw GenerationError from next().
    virtual FragmentStream completeStream(const QString& systemInstruction,
                                          const QString& prompt) = 0;
};

} // namespace cr
