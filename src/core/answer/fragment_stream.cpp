#include "core/answer/fragment_stream.h"

#include <memory>
#include <utility>

namespace cr {

FragmentStream::FragmentStream(PullFn pull)
    : m_pull(std::move(pull))
    , m_finished(!m_pull)
{
}

std::optional<QString> FragmentStream::next()
{
    if (m_finished) {
        return std::nullopt;
    }

    std::optional<QString> fragment;
    try {
        fragment = m_pull();
    } catch (...) {
        m_finished = true;
        m_pull = nullptr;
        throw;
    }

    if (!fragment) {
        m_finished = true;
        m_pull = nullptr;
    }
    return fragment;
}

bool FragmentStream::isFinished() const
{
    return m_finished;
}

QString FragmentStream::collect()
{
    QString text;
    while (std::optional<QString> fragment = next()) {
        text += *fragment;
    }
    return text;
}

FragmentStream FragmentStream::fromFragments(QStringList fragments)
{
    auto remaining = std::make_shared<QStringList>(std::move(fragments));
    auto position = std::make_shared<int>(0);
    return FragmentStream([remaining, position]() -> std::optional<QString> {
        if (*position >= remaining->size()) {
            return std::nullopt;
        }
        return remaining->at((*position)++);
    });
}

FragmentStream FragmentStream::single(const QString& fragment)
{
    return fromFragments(QStringList{fragment});
}

} // namespace cr
