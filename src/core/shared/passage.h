#pragma once

#include <QHashFunctions>
#include <QString>
#include <QStringList>

#include <cstddef>

namespace cr {

// Identity of a passage across independent retrieval methods. Dense and
// sparse hits that refer to the same passage must produce equal keys.
struct PassageKey {
    QString sourceId;
    QStringList sectionPath;
    int chunkIndex = 0;

    bool operator==(const PassageKey& other) const;
    bool operator!=(const PassageKey& other) const { return !(*this == other); }
};

// Coarse key used for citation deduplication: every chunk of one section
// shares a citation.
struct CitationKey {
    QString sourceId;
    QStringList sectionPath;

    bool operator==(const CitationKey& other) const;
    bool operator!=(const CitationKey& other) const { return !(*this == other); }
};

struct QStringHash {
    size_t operator()(const QString& s) const { return qHash(s); }
};

struct PassageKeyHash {
    size_t operator()(const PassageKey& key) const;
};

struct CitationKeyHash {
    size_t operator()(const CitationKey& key) const;
};

// Immutable unit of retrievable text, produced by ingestion.
struct Passage {
    QString text;
    QString sourceId;
    QStringList sectionPath;
    int chunkIndex = 0;

    PassageKey key() const;
    CitationKey citationKey() const;
};

// Separator between heading titles in a displayed section path.
inline constexpr const char* kSectionSeparator = " > ";

// Trimmed heading titles with blanks dropped. Keys are built from this form
// so paths that render the same citation compare equal.
QStringList normalizeSectionPath(const QStringList& sectionPath);

QString sectionDisplay(const QStringList& sectionPath);

// Citation wire format: "[source: <source_id>]" or
// "[source: <source_id> §<section>]".
QString formatCitation(const QString& sourceId, const QStringList& sectionPath);
QString formatCitation(const CitationKey& key);

// Reduce a source path to the stable file-name identifier both rankers use.
QString normalizeSourceId(const QString& sourcePath);

} // namespace cr
