#pragma once

#include "core/shared/passage.h"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace cr {

// Persists the vector id -> passage association of a dense index.
// The database handle is borrowed.
class PassageStore {
public:
    explicit PassageStore(sqlite3* db);
    ~PassageStore();

    PassageStore(const PassageStore&) = delete;
    PassageStore& operator=(const PassageStore&) = delete;

    bool isReady() const;

    bool put(uint64_t vectorId, const Passage& passage);
    std::optional<Passage> get(uint64_t vectorId);
    std::vector<std::pair<uint64_t, Passage>> all();
    int count();
    bool clear();

    bool beginTransaction();
    bool commit();
    void rollback();

private:
    bool prepareStatements();
    static void resetStatement(sqlite3_stmt* stmt);
    static Passage readRow(sqlite3_stmt* stmt, int firstColumn);

    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_putStmt = nullptr;
    sqlite3_stmt* m_getStmt = nullptr;
    sqlite3_stmt* m_allStmt = nullptr;
    sqlite3_stmt* m_countStmt = nullptr;
    sqlite3_stmt* m_clearStmt = nullptr;
    bool m_ready = false;
};

} // namespace cr
