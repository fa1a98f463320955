#pragma once

#include "core/answer/fragment_stream.h"

#include <QString>
#include <QStringList>

#include <vector>

namespace cr {

// One "[source: ...]" marker found in generated text.
struct CitationSpan {
    int start = 0;
    int length = 0;
    QString label;  // text after "source:", whitespace-simplified

    // Canonical "[source: <label>]" form.
    QString marker() const;
};

// Post-generation guardrails over citation markers. Markers are found by a
// left-to-right scan: the literal "[source:", a non-empty label without
// brackets, then "]". Text outside markers is never altered except by
// stripCitations().
class CitationGuard {
public:
    static std::vector<CitationSpan> findCitations(const QString& text);
    static bool hasCitation(const QString& text);

    // Keeps the first occurrence of each of the first maxDistinct distinct
    // citations and deletes every other marker in place. Distinct markers
    // kept are appended to keptMarkers when given.
    // Throws std::invalid_argument when maxDistinct < 0.
    static QString limitCitations(const QString& text, int maxDistinct,
                                  QStringList* keptMarkers = nullptr);

    // Deletes every marker, leaving surrounding text untouched.
    static QString removeCitations(const QString& text);

    // Deletes every marker, then collapses runs of blanks and of 3+ newlines
    // and trims.
    static QString stripCitations(const QString& text);

    // Wraps a stream so markers never reach the consumer: fragments are
    // joined in batches of batchSize, a trailing partial "[source:" or an
    // unclosed marker of any length is held back for the next batch, and
    // markers are removed before yielding.
    // Throws std::invalid_argument when batchSize <= 0.
    static FragmentStream suppressCitations(FragmentStream upstream, int batchSize);

private:
    static int pendingMarkerStart(const QString& text);
};

} // namespace cr
