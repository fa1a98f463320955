#pragma once

#include "core/answer/generation_provider.h"

#include <atomic>
#include <chrono>
#include <functional>

namespace cr {

// Decorator that retries blocking completions on retryable errors with
// linear backoff (backoff * attempt). Streams pass through unretried.
class RetryingGenerationProvider : public GenerationProvider {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryingGenerationProvider(GenerationProvider* inner,
                               int maxAttempts,
                               std::chrono::milliseconds backoff,
                               Sleeper sleeper = {});

    QString complete(const QString& systemInstruction, const QString& prompt) override;
    FragmentStream completeStream(const QString& systemInstruction,
                                  const QString& prompt) override;

    // Attempts used by the most recently finished call.
    int attemptsMade() const { return m_lastAttempts.load(); }

private:
    GenerationProvider* m_inner = nullptr;  // Borrowed
    int m_maxAttempts = 1;
    std::chrono::milliseconds m_backoff{0};
    Sleeper m_sleeper;
    std::atomic<int> m_lastAttempts{0};
};

} // namespace cr
