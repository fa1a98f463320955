#include "core/shared/passage.h"

#include <QFileInfo>
#include <QHashFunctions>

namespace cr {

bool PassageKey::operator==(const PassageKey& other) const
{
    return chunkIndex == other.chunkIndex
        && sourceId == other.sourceId
        && sectionPath == other.sectionPath;
}

bool CitationKey::operator==(const CitationKey& other) const
{
    return sourceId == other.sourceId && sectionPath == other.sectionPath;
}

size_t PassageKeyHash::operator()(const PassageKey& key) const
{
    return qHashMulti(0, key.sourceId, key.sectionPath, key.chunkIndex);
}

size_t CitationKeyHash::operator()(const CitationKey& key) const
{
    return qHashMulti(0, key.sourceId, key.sectionPath);
}

PassageKey Passage::key() const
{
    return PassageKey{sourceId, normalizeSectionPath(sectionPath), chunkIndex};
}

CitationKey Passage::citationKey() const
{
    return CitationKey{sourceId, normalizeSectionPath(sectionPath)};
}

QStringList normalizeSectionPath(const QStringList& sectionPath)
{
    QStringList titles;
    titles.reserve(sectionPath.size());
    for (const QString& title : sectionPath) {
        const QString trimmed = title.trimmed();
        if (!trimmed.isEmpty()) {
            titles.append(trimmed);
        }
    }
    return titles;
}

QString sectionDisplay(const QStringList& sectionPath)
{
    return normalizeSectionPath(sectionPath).join(QString::fromLatin1(kSectionSeparator));
}

QString formatCitation(const QString& sourceId, const QStringList& sectionPath)
{
    QString citation = QStringLiteral("[source: ") + sourceId;
    const QString section = sectionDisplay(sectionPath);
    if (!section.isEmpty()) {
        citation += QStringLiteral(" §") + section;
    }
    citation += QLatin1Char(']');
    return citation;
}

QString formatCitation(const CitationKey& key)
{
    return formatCitation(key.sourceId, key.sectionPath);
}

QString normalizeSourceId(const QString& sourcePath)
{
    const QString trimmed = sourcePath.trimmed();
    if (trimmed.isEmpty()) {
        return QStringLiteral("unknown");
    }
    const QString fileName = QFileInfo(trimmed).fileName();
    return fileName.isEmpty() ? trimmed : fileName;
}

} // namespace cr
