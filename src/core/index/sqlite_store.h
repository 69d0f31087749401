#pragma once

#include "core/index/bot_store.h"
#include "core/shared/types.h"

#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace rb {

constexpr const char* kDefaultFallbackMessage =
    "Sorry, I didn't understand that. Can you rephrase your question?";

// SQLiteStore -- owner of the bots/qna database.
// Single connection; use one store per thread.
class SQLiteStore : public BotStore {
public:
    ~SQLiteStore() override;

    // Move-only (owns sqlite3* handle)
    SQLiteStore(SQLiteStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SQLiteStore& operator=(SQLiteStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    // Open or create the database at the given path.
    // Creates schema and sets pragmas on first open.
    static std::optional<SQLiteStore> open(const QString& dbPath);

    // ── Bots ────────────────────────────────────────────────

    // Returns nullopt when the slug is taken or the insert fails.
    // An empty fallback message stores the default one.
    std::optional<int64_t> addBot(const QString& slug,
                                  const QString& name,
                                  const QString& fallbackMessage = {});

    bool updateFallbackMessage(int64_t botId, const QString& fallbackMessage);

    std::optional<Bot> fetchBotBySlug(const QString& slug) override;
    std::optional<Bot> fetchBotById(int64_t botId);

    // ── Q&A ─────────────────────────────────────────────────

    std::optional<int64_t> addQna(int64_t botId,
                                  const QString& question,
                                  const QString& answer,
                                  const QString& keywords = {},
                                  int priority = kDefaultPriority);

    bool deleteQna(int64_t qnaId);

    std::vector<Candidate> fetchCandidates(int64_t botId) override;

    // ── Transactions ────────────────────────────────────────

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    int schemaVersion() const;

    // Raw handle for tests
    sqlite3* rawDb() const { return m_db; }

private:
    SQLiteStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    sqlite3* m_db = nullptr;
};

} // namespace rb
