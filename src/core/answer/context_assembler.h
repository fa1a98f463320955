#pragma once

#include "core/shared/retrieval_types.h"

#include <QString>
#include <QStringList>

#include <vector>

namespace cr {

struct ContextConfig {
    int maxChars = 2500;
    int maxCitations = 3;
};

struct AssembledContext {
    QString text;
    QStringList citations;  // distinct citation headers, in output order
    int fragmentCount = 0;

    bool isEmpty() const { return text.isEmpty(); }
};

// Turns a best-first hit list into a bounded, citation-tagged context.
// Output length never exceeds maxChars, distinct (source, section) keys never
// exceed maxCitations, and fragment order follows the input.
class ContextAssembler {
public:
    // Throws std::invalid_argument when maxChars or maxCitations <= 0.
    explicit ContextAssembler(ContextConfig config = {});

    AssembledContext assemble(const std::vector<FusedHit>& hits) const;

    // "<citation>\n<text>\n\n"
    static QString formatFragment(const Passage& passage);

    const ContextConfig& config() const { return m_config; }

private:
    ContextConfig m_config;
};

} // namespace cr
