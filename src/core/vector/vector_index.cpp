#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <limits>
#include <optional>

namespace cr {

namespace {

constexpr int kMetaVersion = 1;
constexpr uint64_t kInvalidLabel = std::numeric_limits<uint64_t>::max();

// hnswlib reads past the buffer when handed a truncated file.
constexpr qint64 kMinIndexFileBytes = 96;

// Grow once the graph is 80% full.
constexpr size_t kGrowNumerator = 8;
constexpr size_t kGrowDenominator = 10;

std::optional<QJsonObject> readMetaObject(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR(crIndex, "Cannot open vector metadata %s", qUtf8Printable(path));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_ERROR(crIndex, "Vector metadata %s is not a JSON object: %s",
                  qUtf8Printable(path), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }
    return doc.object();
}

uint64_t readCount(const QJsonObject& meta, const char* key)
{
    return meta.value(QLatin1String(key)).toVariant().toULongLong();
}

} // namespace

VectorIndex::VectorIndex() = default;

VectorIndex::VectorIndex(const IndexMetadata& metadata)
    : m_metadata(metadata)
{
}

VectorIndex::~VectorIndex() = default;

bool VectorIndex::configure(const IndexMetadata& metadata)
{
    if (m_index) {
        LOG_WARN(crIndex, "Vector index already built; configure ignored");
        return false;
    }
    if (metadata.dimensions <= 0) {
        LOG_WARN(crIndex, "Rejecting vector index dimensions %d", metadata.dimensions);
        return false;
    }
    m_metadata = metadata;
    return true;
}

bool VectorIndex::create(int initialCapacity)
{
    if (m_metadata.dimensions <= 0) {
        LOG_ERROR(crIndex, "Cannot create a vector index without dimensions");
        return false;
    }

    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_metadata.dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(), static_cast<size_t>(std::max(initialCapacity, 1)),
            static_cast<size_t>(kM), static_cast<size_t>(kEfConstruction));
    } catch (const std::exception& e) {
        LOG_ERROR(crIndex, "hnswlib refused to allocate the graph: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }

    m_index->setEf(static_cast<size_t>(kEfSearch));
    m_nextLabel = 0;
    LOG_DEBUG(crIndex, "Created vector index dims=%d capacity=%d",
              m_metadata.dimensions, initialCapacity);
    return true;
}

bool VectorIndex::load(const std::string& indexPath, const std::string& metaPath)
{
    const QFileInfo indexFile(QString::fromStdString(indexPath));
    if (!indexFile.isFile()) {
        LOG_ERROR(crIndex, "Vector index file %s does not exist",
                  qUtf8Printable(indexFile.filePath()));
        return false;
    }
    if (indexFile.size() < kMinIndexFileBytes) {
        LOG_ERROR(crIndex, "Vector index file %s is truncated (%lld bytes)",
                  qUtf8Printable(indexFile.filePath()), static_cast<long long>(indexFile.size()));
        return false;
    }

    const std::optional<QJsonObject> meta = readMetaObject(QString::fromStdString(metaPath));
    if (!meta) {
        return false;
    }

    const int dimensions = meta->value(QStringLiteral("dimensions")).toInt(-1);
    if (dimensions <= 0) {
        LOG_ERROR(crIndex, "Vector metadata has no usable dimensions");
        return false;
    }
    if (m_metadata.dimensions > 0 && m_metadata.dimensions != dimensions) {
        LOG_ERROR(crIndex, "Stored vectors have %d dimensions, expected %d",
                  dimensions, m_metadata.dimensions);
        return false;
    }

    const uint64_t storedCount = readCount(*meta, "total_elements");
    const uint64_t storedNextLabel = readCount(*meta, "next_label");
    const uint64_t capacity = std::max({static_cast<uint64_t>(kInitialCapacity),
                                        storedNextLabel + 1, storedCount * 2});
    if (capacity > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
        LOG_ERROR(crIndex, "Vector metadata requests an impossible capacity");
        return false;
    }

    IndexMetadata loaded;
    loaded.dimensions = dimensions;
    loaded.schemaVersion = meta->value(QStringLiteral("version")).toInt(kMetaVersion);
    loaded.modelId = meta->value(QStringLiteral("model_id"))
                         .toString(QStringLiteral("unknown")).toStdString();
    loaded.generationId = meta->value(QStringLiteral("generation_id"))
                              .toString(QStringLiteral("v1")).toStdString();

    auto space = std::make_unique<hnswlib::InnerProductSpace>(dimensions);
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> graph;
    try {
        graph = std::make_unique<hnswlib::HierarchicalNSW<float>>(space.get());
        graph->loadIndex(indexPath, space.get(), static_cast<size_t>(capacity));
    } catch (const std::exception& e) {
        LOG_ERROR(crIndex, "hnswlib could not read %s: %s",
                  qUtf8Printable(indexFile.filePath()), e.what());
        return false;
    }
    graph->setEf(static_cast<size_t>(kEfSearch));

    m_metadata = loaded;
    m_space = std::move(space);
    m_index = std::move(graph);
    m_nextLabel = storedNextLabel;
    LOG_INFO(crIndex, "Loaded %d vectors for model %s", totalElements(), m_metadata.modelId.c_str());
    return true;
}

bool VectorIndex::save(const std::string& indexPath, const std::string& metaPath) const
{
    if (!m_index) {
        LOG_WARN(crIndex, "Nothing to save: vector index was never built");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            m_index->saveIndex(indexPath);
        } catch (const std::exception& e) {
            LOG_ERROR(crIndex, "Writing vector index failed: %s", e.what());
            return false;
        }
    }

    const QJsonObject meta{
        {QStringLiteral("version"), kMetaVersion},
        {QStringLiteral("model_id"), QString::fromStdString(m_metadata.modelId)},
        {QStringLiteral("generation_id"), QString::fromStdString(m_metadata.generationId)},
        {QStringLiteral("dimensions"), m_metadata.dimensions},
        {QStringLiteral("total_elements"), totalElements()},
        {QStringLiteral("next_label"), static_cast<qint64>(m_nextLabel)},
        {QStringLiteral("ef_construction"), kEfConstruction},
        {QStringLiteral("m"), kM},
        {QStringLiteral("saved_at"), QDateTime::currentDateTimeUtc().toString(Qt::ISODate)},
    };

    QFile file(QString::fromStdString(metaPath));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(crIndex, "Cannot write vector metadata %s", qUtf8Printable(file.fileName()));
        return false;
    }
    if (file.write(QJsonDocument(meta).toJson(QJsonDocument::Indented)) < 0) {
        LOG_ERROR(crIndex, "Short write on vector metadata %s", qUtf8Printable(file.fileName()));
        return false;
    }
    return true;
}

uint64_t VectorIndex::addVector(const float* embedding)
{
    if (!m_index || !embedding) {
        LOG_WARN(crIndex, "addVector without a built index or vector");
        return kInvalidLabel;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureCapacityForOneMore()) {
        return kInvalidLabel;
    }

    try {
        m_index->addPoint(embedding, static_cast<hnswlib::labeltype>(m_nextLabel));
    } catch (const std::exception& e) {
        LOG_ERROR(crIndex, "hnswlib rejected vector %llu: %s",
                  static_cast<unsigned long long>(m_nextLabel), e.what());
        return kInvalidLabel;
    }
    return m_nextLabel++;
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(const float* queryVector, int k) const
{
    if (!m_index || !queryVector || k <= 0) {
        return {};
    }

    std::vector<KnnResult> results;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            // searchKnn returns a max-heap, farthest first.
            auto heap = m_index->searchKnn(queryVector, static_cast<size_t>(k));
            results.resize(heap.size());
            for (auto slot = results.rbegin(); slot != results.rend(); ++slot) {
                *slot = KnnResult{static_cast<uint64_t>(heap.top().second), heap.top().first};
                heap.pop();
            }
        } catch (const std::exception& e) {
            LOG_ERROR(crIndex, "Vector search failed: %s", e.what());
            return {};
        }
    }
    return results;
}

int VectorIndex::totalElements() const
{
    return m_index ? static_cast<int>(m_index->getCurrentElementCount()) : 0;
}

bool VectorIndex::isAvailable() const
{
    return m_index != nullptr;
}

uint64_t VectorIndex::nextLabel() const
{
    return m_nextLabel;
}

int VectorIndex::dimensions() const
{
    return m_metadata.dimensions;
}

const VectorIndex::IndexMetadata& VectorIndex::metadata() const
{
    return m_metadata;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t capacity = m_index->getMaxElements();
    if (m_index->getCurrentElementCount() < capacity * kGrowNumerator / kGrowDenominator) {
        return true;
    }
    if (capacity == 0 || capacity > std::numeric_limits<size_t>::max() / 2) {
        LOG_ERROR(crIndex, "Vector index cannot grow past %zu slots", capacity);
        return false;
    }

    try {
        m_index->resizeIndex(capacity * 2);
    } catch (const std::exception& e) {
        LOG_ERROR(crIndex, "Growing vector index failed: %s", e.what());
        return false;
    }
    LOG_DEBUG(crIndex, "Vector index grown to %zu slots", capacity * 2);
    return true;
}

} // namespace cr
