#pragma once

#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

namespace cr {

// Pull-based, finite, non-restartable sequence of text fragments. Nothing is
// produced until next() is called; a consumer cancels by no longer pulling.
class FragmentStream {
public:
    // Returns the next fragment, or nullopt once the sequence has ended.
    using PullFn = std::function<std::optional<QString>()>;

    FragmentStream() = default;
    explicit FragmentStream(PullFn pull);

    FragmentStream(FragmentStream&&) = default;
    FragmentStream& operator=(FragmentStream&&) = default;
    FragmentStream(const FragmentStream&) = delete;
    FragmentStream& operator=(const FragmentStream&) = delete;

    // Exceptions thrown by the producer propagate; the stream is finished
    // afterwards.
    std::optional<QString> next();
    bool isFinished() const;

    // Drains every remaining fragment and concatenates them.
    QString collect();

    static FragmentStream fromFragments(QStringList fragments);
    static FragmentStream single(const QString& fragment);

private:
    PullFn m_pull;
    bool m_finished = true;
};

} // namespace cr
