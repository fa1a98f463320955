#include "core/vector/passage_store.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QJsonArray>
#include <QJsonDocument>

#include <limits>

namespace cr {

namespace {

constexpr const char* kCreatePassagesSql = R"(
    CREATE TABLE IF NOT EXISTS passages (
        vector_id INTEGER PRIMARY KEY,
        source_id TEXT NOT NULL,
        section_path TEXT NOT NULL DEFAULT '[]',
        chunk_index INTEGER NOT NULL DEFAULT 0,
        text TEXT NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_passages_source
        ON passages(source_id, chunk_index);
)";

constexpr const char* kPutSql = R"(
    INSERT OR REPLACE INTO passages (vector_id, source_id, section_path, chunk_index, text)
    VALUES (?1, ?2, ?3, ?4, ?5)
)";
constexpr const char* kGetSql =
    "SELECT source_id, section_path, chunk_index, text FROM passages WHERE vector_id = ?1";
constexpr const char* kAllSql =
    "SELECT vector_id, source_id, section_path, chunk_index, text FROM passages "
    "ORDER BY vector_id ASC";
constexpr const char* kCountSql = "SELECT COUNT(*) FROM passages";
constexpr const char* kClearSql = "DELETE FROM passages";

bool execSql(sqlite3* db, const char* sql)
{
    if (!db) {
        return false;
    }
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(crIndex, "PassageStore SQL failed: %s", errMsg ? errMsg : "unknown error");
        if (errMsg) {
            sqlite3_free(errMsg);
        }
        return false;
    }
    return true;
}

QByteArray encodeSectionPath(const QStringList& sectionPath)
{
    return QJsonDocument(QJsonArray::fromStringList(sectionPath)).toJson(QJsonDocument::Compact);
}

QStringList decodeSectionPath(const char* raw)
{
    QStringList sectionPath;
    if (!raw) {
        return sectionPath;
    }
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray(raw));
    if (!doc.isArray()) {
        return sectionPath;
    }
    for (const QJsonValue& value : doc.array()) {
        sectionPath.append(value.toString());
    }
    return sectionPath;
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const auto* raw = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return raw ? QString::fromUtf8(raw) : QString();
}

} // namespace

PassageStore::PassageStore(sqlite3* db)
    : m_db(db)
{
    m_ready = prepareStatements();
}

PassageStore::~PassageStore()
{
    sqlite3_finalize(m_putStmt);
    sqlite3_finalize(m_getStmt);
    sqlite3_finalize(m_allStmt);
    sqlite3_finalize(m_countStmt);
    sqlite3_finalize(m_clearStmt);
}

bool PassageStore::isReady() const
{
    return m_ready;
}

bool PassageStore::put(uint64_t vectorId, const Passage& passage)
{
    if (!m_ready || vectorId > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }

    const QByteArray sourceUtf8 = passage.sourceId.toUtf8();
    const QByteArray sectionJson = encodeSectionPath(passage.sectionPath);
    const QByteArray textUtf8 = passage.text.toUtf8();

    sqlite3_bind_int64(m_putStmt, 1, static_cast<int64_t>(vectorId));
    sqlite3_bind_text(m_putStmt, 2, sourceUtf8.constData(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_putStmt, 3, sectionJson.constData(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(m_putStmt, 4, passage.chunkIndex);
    sqlite3_bind_text(m_putStmt, 5, textUtf8.constData(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(m_putStmt);
    resetStatement(m_putStmt);
    return rc == SQLITE_DONE;
}

std::optional<Passage> PassageStore::get(uint64_t vectorId)
{
    if (!m_ready || vectorId > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }

    sqlite3_bind_int64(m_getStmt, 1, static_cast<int64_t>(vectorId));
    const int rc = sqlite3_step(m_getStmt);
    if (rc == SQLITE_ROW) {
        Passage passage = readRow(m_getStmt, 0);
        resetStatement(m_getStmt);
        return passage;
    }

    resetStatement(m_getStmt);
    return std::nullopt;
}

std::vector<std::pair<uint64_t, Passage>> PassageStore::all()
{
    std::vector<std::pair<uint64_t, Passage>> rows;
    if (!m_ready) {
        return rows;
    }

    while (sqlite3_step(m_allStmt) == SQLITE_ROW) {
        const int64_t vectorId = sqlite3_column_int64(m_allStmt, 0);
        if (vectorId < 0) {
            continue;
        }
        rows.emplace_back(static_cast<uint64_t>(vectorId), readRow(m_allStmt, 1));
    }
    resetStatement(m_allStmt);
    return rows;
}

int PassageStore::count()
{
    if (!m_ready) {
        return 0;
    }

    const int rc = sqlite3_step(m_countStmt);
    if (rc == SQLITE_ROW) {
        const int count = sqlite3_column_int(m_countStmt, 0);
        resetStatement(m_countStmt);
        return count;
    }

    resetStatement(m_countStmt);
    return 0;
}

bool PassageStore::clear()
{
    if (!m_ready) {
        return false;
    }
    const int rc = sqlite3_step(m_clearStmt);
    resetStatement(m_clearStmt);
    return rc == SQLITE_DONE;
}

bool PassageStore::beginTransaction()
{
    return m_ready && execSql(m_db, "BEGIN IMMEDIATE");
}

bool PassageStore::commit()
{
    return m_ready && execSql(m_db, "COMMIT");
}

void PassageStore::rollback()
{
    if (m_ready && !execSql(m_db, "ROLLBACK")) {
        LOG_WARN(crIndex, "PassageStore rollback failed");
    }
}

bool PassageStore::prepareStatements()
{
    if (!m_db) {
        return false;
    }

    if (!execSql(m_db, kCreatePassagesSql)) {
        return false;
    }

    if (sqlite3_prepare_v2(m_db, kPutSql, -1, &m_putStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kGetSql, -1, &m_getStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kAllSql, -1, &m_allStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kCountSql, -1, &m_countStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kClearSql, -1, &m_clearStmt, nullptr) != SQLITE_OK) {
        return false;
    }

    return true;
}

void PassageStore::resetStatement(sqlite3_stmt* stmt)
{
    if (!stmt) {
        return;
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

Passage PassageStore::readRow(sqlite3_stmt* stmt, int firstColumn)
{
    Passage passage;
    passage.sourceId = columnText(stmt, firstColumn);
    passage.sectionPath = decodeSectionPath(
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, firstColumn + 1)));
    passage.chunkIndex = sqlite3_column_int(stmt, firstColumn + 2);
    passage.text = columnText(stmt, firstColumn + 3);
    return passage;
}

} // namespace cr
