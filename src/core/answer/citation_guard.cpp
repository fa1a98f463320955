#include "core/answer/citation_guard.h"

#include <QRegularExpression>
#include <QSet>

#include <memory>
#include <stdexcept>

namespace cr {

namespace {

const QString& markerPrefix()
{
    static const QString prefix = QStringLiteral("[source:");
    return prefix;
}

QString removeSpans(const QString& text, const std::vector<CitationSpan>& spans,
                    const std::vector<bool>& keep)
{
    QString result;
    result.reserve(text.size());
    int cursor = 0;
    for (size_t i = 0; i < spans.size(); ++i) {
        if (keep[i]) {
            continue;
        }
        result += text.mid(cursor, spans[i].start - cursor);
        cursor = spans[i].start + spans[i].length;
    }
    result += text.mid(cursor);
    return result;
}

} // namespace

QString CitationSpan::marker() const
{
    return QStringLiteral("[source: ") + label + QLatin1Char(']');
}

std::vector<CitationSpan> CitationGuard::findCitations(const QString& text)
{
    std::vector<CitationSpan> spans;
    const QString& prefix = markerPrefix();

    int from = 0;
    while (from < text.size()) {
        const int start = text.indexOf(prefix, from);
        if (start < 0) {
            break;
        }

        int close = -1;
        bool nested = false;
        for (int i = start + prefix.size(); i < text.size(); ++i) {
            const QChar ch = text.at(i);
            if (ch == QLatin1Char(']')) {
                close = i;
                break;
            }
            if (ch == QLatin1Char('[')) {
                nested = true;
                break;
            }
        }

        if (nested) {
            from = start + 1;
            continue;
        }
        if (close < 0) {
            break;
        }

        const int labelStart = start + prefix.size();
        const QString label = text.mid(labelStart, close - labelStart).simplified();
        if (!label.isEmpty()) {
            spans.push_back(CitationSpan{start, close - start + 1, label});
        }
        from = close + 1;
    }
    return spans;
}

bool CitationGuard::hasCitation(const QString& text)
{
    return !findCitations(text).empty();
}

QString CitationGuard::limitCitations(const QString& text, int maxDistinct, QStringList* keptMarkers)
{
    if (maxDistinct < 0) {
        throw std::invalid_argument("CitationGuard::limitCitations requires maxDistinct >= 0");
    }

    const std::vector<CitationSpan> spans = findCitations(text);
    std::vector<bool> keep(spans.size(), false);
    QSet<QString> seen;
    for (size_t i = 0; i < spans.size(); ++i) {
        const QString& label = spans[i].label;
        if (seen.contains(label) || seen.size() >= maxDistinct) {
            continue;
        }
        seen.insert(label);
        keep[i] = true;
        if (keptMarkers) {
            keptMarkers->append(spans[i].marker());
        }
    }
    return removeSpans(text, spans, keep);
}

QString CitationGuard::removeCitations(const QString& text)
{
    const std::vector<CitationSpan> spans = findCitations(text);
    return removeSpans(text, spans, std::vector<bool>(spans.size(), false));
}

QString CitationGuard::stripCitations(const QString& text)
{
    static const QRegularExpression blankRunRegex(QStringLiteral("[ \\t]{2,}"));
    static const QRegularExpression newlineRunRegex(QStringLiteral("\\n{3,}"));

    QString cleaned = removeCitations(text);
    cleaned.replace(blankRunRegex, QStringLiteral(" "));
    cleaned.replace(newlineRunRegex, QStringLiteral("\n\n"));
    return cleaned.trimmed();
}

int CitationGuard::pendingMarkerStart(const QString& text)
{
    const QString& prefix = markerPrefix();

    // An opened marker is held back whatever its length; the stream is finite.
    // A '[' before the closing ']' cancels it, as in findCitations.
    const int lastMarker = text.lastIndexOf(prefix);
    if (lastMarker >= 0) {
        bool closedOrCancelled = false;
        for (int i = lastMarker + prefix.size(); i < text.size(); ++i) {
            if (text.at(i) == QLatin1Char(']') || text.at(i) == QLatin1Char('[')) {
                closedOrCancelled = true;
                break;
            }
        }
        if (!closedOrCancelled) {
            return lastMarker;
        }
    }

    const int lastOpen = text.lastIndexOf(QLatin1Char('['));
    if (lastOpen < 0 || text.indexOf(QLatin1Char(']'), lastOpen) >= 0) {
        return -1;
    }
    return prefix.startsWith(text.mid(lastOpen)) ? lastOpen : -1;
}

FragmentStream CitationGuard::suppressCitations(FragmentStream upstream, int batchSize)
{
    if (batchSize <= 0) {
        throw std::invalid_argument("CitationGuard::suppressCitations requires batchSize > 0");
    }

    struct State {
        FragmentStream upstream;
        int batchSize = 0;
        QString carry;
        bool upstreamDone = false;
    };
    auto state = std::make_shared<State>();
    state->upstream = std::move(upstream);
    state->batchSize = batchSize;

    return FragmentStream([state]() -> std::optional<QString> {
        while (!state->upstreamDone || !state->carry.isEmpty()) {
            QString batch = std::move(state->carry);
            state->carry.clear();

            int pulled = 0;
            while (!state->upstreamDone && pulled < state->batchSize) {
                std::optional<QString> fragment = state->upstream.next();
                if (!fragment) {
                    state->upstreamDone = true;
                    break;
                }
                batch += *fragment;
                ++pulled;
            }

            if (!state->upstreamDone) {
                const int holdFrom = pendingMarkerStart(batch);
                if (holdFrom >= 0) {
                    state->carry = batch.mid(holdFrom);
                    batch.truncate(holdFrom);
                }
            }

            const QString cleaned = removeCitations(batch);
            if (!cleaned.isEmpty()) {
                return cleaned;
            }
        }
        return std::nullopt;
    });
}

} // namespace cr
