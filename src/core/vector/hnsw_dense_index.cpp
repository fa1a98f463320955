#include "core/vector/hnsw_dense_index.h"
#include "core/embedding/embedding_provider.h"
#include "core/shared/logging.h"
#include "core/vector/passage_store.h"

#include <sqlite3.h>

#include <QDir>
#include <QFile>

#include <algorithm>
#include <limits>

namespace cr {

namespace {

struct SqliteCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using SqliteHandle = std::unique_ptr<sqlite3, SqliteCloser>;

SqliteHandle openDatabase(const QString& path, int flags)
{
    sqlite3* raw = nullptr;
    const QByteArray pathUtf8 = path.toUtf8();
    const int rc = sqlite3_open_v2(pathUtf8.constData(), &raw, flags, nullptr);
    SqliteHandle handle(raw);
    if (rc != SQLITE_OK) {
        LOG_ERROR(crIndex, "Failed to open passage database %s: %s",
                  qUtf8Printable(path), raw ? sqlite3_errmsg(raw) : "out of memory");
        return nullptr;
    }
    return handle;
}

std::string filePathIn(const QString& directory, const char* fileName)
{
    return QDir(directory).filePath(QString::fromLatin1(fileName)).toStdString();
}

} // namespace

HnswDenseIndex::HnswDenseIndex()
    : m_index(std::make_unique<VectorIndex>())
{
}

HnswDenseIndex::HnswDenseIndex(const VectorIndex::IndexMetadata& metadata)
    : m_index(std::make_unique<VectorIndex>(metadata))
{
}

HnswDenseIndex::~HnswDenseIndex() = default;

std::shared_ptr<HnswDenseIndex> HnswDenseIndex::build(const std::vector<Passage>& passages,
                                                      EmbeddingProvider* embedder,
                                                      VectorIndex::IndexMetadata metadata)
{
    if (!embedder) {
        LOG_WARN(crIndex, "HnswDenseIndex::build skipped: no embedding provider");
        return nullptr;
    }
    if (metadata.dimensions <= 0) {
        metadata.dimensions = embedder->dimensions();
    }

    auto index = std::make_shared<HnswDenseIndex>(metadata);
    const int capacity = std::max(VectorIndex::kInitialCapacity,
                                  static_cast<int>(passages.size()) * 2);
    if (!index->create(capacity)) {
        return nullptr;
    }

    int skipped = 0;
    for (const Passage& passage : passages) {
        if (!index->addPassage(passage, embedder->embed(passage.text))) {
            ++skipped;
        }
    }

    if (skipped > 0) {
        LOG_WARN(crIndex, "HnswDenseIndex::build skipped %d of %d passages",
                 skipped, static_cast<int>(passages.size()));
    }
    if (index->vectorCount() == 0 && !passages.empty()) {
        LOG_ERROR(crIndex, "HnswDenseIndex::build produced no vectors");
        return nullptr;
    }

    LOG_INFO(crIndex, "HnswDenseIndex built: vectors=%d dimensions=%d",
             index->vectorCount(), index->dimensions());
    return index;
}

bool HnswDenseIndex::create(int initialCapacity)
{
    m_passages.clear();
    return m_index->create(initialCapacity);
}

bool HnswDenseIndex::addPassage(const Passage& passage, const std::vector<float>& embedding)
{
    if (!m_index->isAvailable()) {
        return false;
    }
    if (embedding.empty() || static_cast<int>(embedding.size()) != m_index->dimensions()) {
        LOG_WARN(crIndex, "HnswDenseIndex::addPassage rejected embedding of size %d for %s#%d",
                 static_cast<int>(embedding.size()), qUtf8Printable(passage.sourceId),
                 passage.chunkIndex);
        return false;
    }

    const std::vector<float> normalized = normalizeEmbedding(embedding);
    const uint64_t label = m_index->addVector(normalized.data());
    if (label == std::numeric_limits<uint64_t>::max()) {
        return false;
    }
    m_passages.emplace(label, passage);
    return true;
}

bool HnswDenseIndex::save(const QString& directory) const
{
    if (!isReady()) {
        LOG_WARN(crIndex, "HnswDenseIndex::save called on unready index");
        return false;
    }
    if (!QDir().mkpath(directory)) {
        LOG_ERROR(crIndex, "Failed to create index directory: %s", qUtf8Printable(directory));
        return false;
    }

    if (!m_index->save(filePathIn(directory, kIndexFileName), filePathIn(directory, kMetaFileName))) {
        return false;
    }

    const QString dbPath = QDir(directory).filePath(QString::fromLatin1(kPassageDbFileName));
    SqliteHandle db = openDatabase(dbPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    if (!db) {
        return false;
    }

    PassageStore store(db.get());
    if (!store.isReady() || !store.beginTransaction()) {
        LOG_ERROR(crIndex, "Passage store unavailable at %s", qUtf8Printable(dbPath));
        return false;
    }
    if (!store.clear()) {
        store.rollback();
        return false;
    }
    for (const auto& [vectorId, passage] : m_passages) {
        if (!store.put(vectorId, passage)) {
            LOG_ERROR(crIndex, "Failed to persist passage for vector %llu",
                      static_cast<unsigned long long>(vectorId));
            store.rollback();
            return false;
        }
    }
    return store.commit();
}

bool HnswDenseIndex::load(const QString& directory)
{
    const QString dbPath = QDir(directory).filePath(QString::fromLatin1(kPassageDbFileName));
    if (!QFile::exists(dbPath)) {
        LOG_WARN(crIndex, "HnswDenseIndex::load missing passage database: %s", qUtf8Printable(dbPath));
        return false;
    }

    auto index = std::make_unique<VectorIndex>(m_index->metadata());
    if (!index->load(filePathIn(directory, kIndexFileName), filePathIn(directory, kMetaFileName))) {
        return false;
    }

    SqliteHandle db = openDatabase(dbPath, SQLITE_OPEN_READWRITE);
    if (!db) {
        return false;
    }

    std::unordered_map<uint64_t, Passage> passages;
    {
        PassageStore store(db.get());
        if (!store.isReady()) {
            LOG_ERROR(crIndex, "Passage store unavailable at %s", qUtf8Printable(dbPath));
            return false;
        }
        for (auto& [vectorId, passage] : store.all()) {
            passages.emplace(vectorId, std::move(passage));
        }
    }

    if (static_cast<int>(passages.size()) != index->totalElements()) {
        LOG_WARN(crIndex, "HnswDenseIndex::load: %d passages for %d vectors",
                 static_cast<int>(passages.size()), index->totalElements());
    }

    m_index = std::move(index);
    m_passages = std::move(passages);
    LOG_INFO(crIndex, "HnswDenseIndex loaded from %s: vectors=%d",
             qUtf8Printable(directory), vectorCount());
    return true;
}

bool HnswDenseIndex::isReady() const
{
    return m_index && m_index->isAvailable();
}

int HnswDenseIndex::dimensions() const
{
    return m_index ? m_index->dimensions() : 0;
}

int HnswDenseIndex::vectorCount() const
{
    return m_index ? m_index->totalElements() : 0;
}

QString HnswDenseIndex::modelId() const
{
    return m_index ? QString::fromStdString(m_index->metadata().modelId) : QString();
}

std::vector<DenseIndex::Neighbor> HnswDenseIndex::nearest(const std::vector<float>& vector, int k) const
{
    std::vector<Neighbor> neighbors;
    if (!isReady() || k <= 0 || static_cast<int>(vector.size()) != dimensions()) {
        return neighbors;
    }

    const std::vector<VectorIndex::KnnResult> results = m_index->search(vector.data(), k);
    neighbors.reserve(results.size());
    for (const VectorIndex::KnnResult& result : results) {
        neighbors.push_back(Neighbor{result.label, 1.0f - result.distance});
    }
    return neighbors;
}

std::optional<Passage> HnswDenseIndex::passageFor(uint64_t vectorId) const
{
    const auto it = m_passages.find(vectorId);
    if (it == m_passages.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace cr
