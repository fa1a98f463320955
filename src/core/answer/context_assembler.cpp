#include "core/answer/context_assembler.h"
#include "core/shared/logging.h"

#include <stdexcept>
#include <unordered_set>

namespace cr {

ContextAssembler::ContextAssembler(ContextConfig config)
    : m_config(config)
{
    if (m_config.maxChars <= 0) {
        throw std::invalid_argument("ContextAssembler requires maxChars > 0");
    }
    if (m_config.maxCitations <= 0) {
        throw std::invalid_argument("ContextAssembler requires maxCitations > 0");
    }
}

QString ContextAssembler::formatFragment(const Passage& passage)
{
    return formatCitation(passage.sourceId, passage.sectionPath)
        + QLatin1Char('\n') + passage.text.trimmed() + QStringLiteral("\n\n");
}

AssembledContext ContextAssembler::assemble(const std::vector<FusedHit>& hits) const
{
    AssembledContext result;
    QString text;
    std::unordered_set<CitationKey, CitationKeyHash> seen;

    for (const FusedHit& hit : hits) {
        const CitationKey citationKey = hit.passage.citationKey();
        if (seen.count(citationKey) > 0) {
            continue;
        }

        const QString fragment = formatFragment(hit.passage);
        if (text.size() + fragment.size() > m_config.maxChars) {
            break;
        }

        text += fragment;
        seen.insert(citationKey);
        result.citations.append(formatCitation(citationKey));
        ++result.fragmentCount;

        if (static_cast<int>(seen.size()) >= m_config.maxCitations) {
            break;
        }
    }

    result.text = text.trimmed();
    LOG_DEBUG(crAnswer, "ContextAssembler: hits=%d fragments=%d chars=%d",
              static_cast<int>(hits.size()), result.fragmentCount,
              static_cast<int>(result.text.size()));
    return result;
}

} // namespace cr
