#include "core/answer/retrying_generation_provider.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <string>
#include <thread>

namespace cr {

RetryingGenerationProvider::RetryingGenerationProvider(GenerationProvider* inner,
                                                       int maxAttempts,
                                                       std::chrono::milliseconds backoff,
                                                       Sleeper sleeper)
    : m_inner(inner)
    , m_maxAttempts(std::max(1, maxAttempts))
    , m_backoff(backoff)
    , m_sleeper(std::move(sleeper))
{
    if (!m_sleeper) {
        m_sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

QString RetryingGenerationProvider::complete(const QString& systemInstruction, const QString& prompt)
{
    if (!m_inner) {
        throw GenerationError("no generation provider configured");
    }

    std::string lastError;
    for (int attempt = 1; attempt <= m_maxAttempts; ++attempt) {
        try {
            QString text = m_inner->complete(systemInstruction, prompt).trimmed();
            m_lastAttempts.store(attempt);
            return text;
        } catch (const GenerationError& e) {
            lastError = e.what();
            LOG_WARN(crAnswer, "Generation attempt %d/%d failed (status=%d): %s",
                     attempt, m_maxAttempts, e.status().value_or(-1), e.what());
            if (!e.isRetryable()) {
                m_lastAttempts.store(attempt);
                throw;
            }
        }
        if (attempt < m_maxAttempts) {
            m_sleeper(m_backoff * attempt);
        }
    }

    m_lastAttempts.store(m_maxAttempts);
    throw GenerationError("generation failed after " + std::to_string(m_maxAttempts)
                          + " attempts: " + lastError);
}

FragmentStream RetryingGenerationProvider::completeStream(const QString& systemInstruction,
                                                          const QString& prompt)
{
    if (!m_inner) {
        throw GenerationError("no generation provider configured");
    }
    return m_inner->completeStream(systemInstruction, prompt);
}

} // namespace cr
