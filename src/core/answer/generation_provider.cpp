#include "core/answer/generation_provider.h"

namespace cr {

GenerationError::GenerationError(const std::string& message, std::optional<int> status)
    : std::runtime_error(message)
    , m_status(status)
{
}

std::optional<int> GenerationError::status() const
{
    return m_status;
}

bool GenerationError::isRetryable() const
{
    if (!m_status) {
        return true;
    }
    switch (*m_status) {
    case 500:
    case 502:
    case 503:
    case 504:
        return true;
    default:
        return false;
    }
}

} // namespace cr
