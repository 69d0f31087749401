#include "core/index/sqlite_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFile>

#include <utility>

namespace rb {

namespace {

QString nowIso()
{
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

// Columns: id, slug, name, fallback_message
Bot readBotRow(sqlite3_stmt* stmt)
{
    Bot bot;
    bot.id = sqlite3_column_int64(stmt, 0);
    bot.slug = columnText(stmt, 1);
    bot.name = columnText(stmt, 2);
    if (sqlite3_column_type(stmt, 3) == SQLITE_NULL) {
        bot.fallbackMessage = QString::fromUtf8(kDefaultFallbackMessage);
    } else {
        bot.fallbackMessage = columnText(stmt, 3);
    }
    return bot;
}

} // namespace

SQLiteStore::~SQLiteStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SQLiteStore> SQLiteStore::open(const QString& dbPath)
{
    SQLiteStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool SQLiteStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rbStore, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(rbStore, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='bots'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(rbStore, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kSchemaV1)) {
            LOG_ERROR(rbStore, "Failed to create schema");
            return false;
        }
    }

    const int version = schemaVersion();
    if (version > kCurrentSchemaVersion) {
        LOG_ERROR(rbStore, "Database schema version %d is newer than supported %d",
                  version, kCurrentSchemaVersion);
        return false;
    }

    // Restrict database file permissions to owner-only (0600)
    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(rbStore, "Database opened successfully: %s", qUtf8Printable(dbPath));
    return true;
}

bool SQLiteStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rbStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

int SQLiteStore::schemaVersion() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "PRAGMA user_version", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return version;
}

// ── Bots ────────────────────────────────────────────────────

std::optional<int64_t> SQLiteStore::addBot(const QString& slug,
                                           const QString& name,
                                           const QString& fallbackMessage)
{
    const char* sql = R"(
        INSERT INTO bots (slug, name, fallback_message, created_at, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?4)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rbStore, "addBot prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QByteArray slugUtf8 = slug.toUtf8();
    const QByteArray nameUtf8 = name.toUtf8();
    const QByteArray fallbackUtf8 = fallbackMessage.isEmpty()
        ? QByteArray(kDefaultFallbackMessage)
        : fallbackMessage.toUtf8();
    const QByteArray nowUtf8 = nowIso().toUtf8();

    sqlite3_bind_text(stmt, 1, slugUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, nameUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, fallbackUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, nowUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        LOG_WARN(rbStore, "Bot with slug '%s' already exists", qUtf8Printable(slug));
        return std::nullopt;
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR(rbStore, "addBot failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

bool SQLiteStore::updateFallbackMessage(int64_t botId, const QString& fallbackMessage)
{
    const char* sql = "UPDATE bots SET fallback_message = ?1, updated_at = ?2 WHERE id = ?3";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rbStore, "updateFallbackMessage prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray messageUtf8 = fallbackMessage.toUtf8();
    const QByteArray nowUtf8 = nowIso().toUtf8();
    sqlite3_bind_text(stmt, 1, messageUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, nowUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, botId);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(rbStore, "updateFallbackMessage failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return sqlite3_changes(m_db) > 0;
}

std::optional<Bot> SQLiteStore::fetchBotBySlug(const QString& slug)
{
    const char* sql = "SELECT id, slug, name, fallback_message FROM bots WHERE slug = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rbStore, "fetchBotBySlug prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray slugUtf8 = slug.toUtf8();
    sqlite3_bind_text(stmt, 1, slugUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<Bot> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readBotRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<Bot> SQLiteStore::fetchBotById(int64_t botId)
{
    const char* sql = "SELECT id, slug, name, fallback_message FROM bots WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rbStore, "fetchBotById prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, botId);

    std::optional<Bot> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readBotRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

// ── Q&A ─────────────────────────────────────────────────────

std::optional<int64_t> SQLiteStore::addQna(int64_t botId,
                                           const QString& question,
                                           const QString& answer,
                                           const QString& keywords,
                                           int priority)
{
    const char* sql = R"(
        INSERT INTO qna (bot_id, question, answer, keywords, priority, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rbStore, "addQna prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QByteArray questionUtf8 = question.toUtf8();
    const QByteArray answerUtf8 = answer.toUtf8();
    const QByteArray keywordsUtf8 = keywords.toUtf8();
    const QByteArray nowUtf8 = nowIso().toUtf8();

    sqlite3_bind_int64(stmt, 1, botId);
    sqlite3_bind_text(stmt, 2, questionUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, answerUtf8.constData(), -1, SQLITE_STATIC);
    if (keywords.isEmpty()) {
        sqlite3_bind_null(stmt, 4);
    } else {
        sqlite3_bind_text(stmt, 4, keywordsUtf8.constData(), -1, SQLITE_STATIC);
    }
    sqlite3_bind_int(stmt, 5, priority);
    sqlite3_bind_text(stmt, 6, nowUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(rbStore, "addQna failed for bot %lld: %s",
                  static_cast<long long>(botId), sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

bool SQLiteStore::deleteQna(int64_t qnaId)
{
    const char* sql = "DELETE FROM qna WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rbStore, "deleteQna prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, qnaId);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

std::vector<Candidate> SQLiteStore::fetchCandidates(int64_t botId)
{
    const char* sql = R"(
        SELECT id, question, answer, keywords, priority
        FROM qna
        WHERE bot_id = ?1
        ORDER BY COALESCE(priority, ?2) DESC, id ASC
    )";

    std::vector<Candidate> candidates;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rbStore, "fetchCandidates prepare failed: %s", sqlite3_errmsg(m_db));
        return candidates;
    }
    sqlite3_bind_int64(stmt, 1, botId);
    sqlite3_bind_int(stmt, 2, kDefaultPriority);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Candidate candidate;
        candidate.id = sqlite3_column_int64(stmt, 0);
        candidate.question = columnText(stmt, 1);
        candidate.answer = columnText(stmt, 2);
        candidate.keywordSpec = columnText(stmt, 3);
        candidate.priority = sqlite3_column_type(stmt, 4) == SQLITE_NULL
            ? kDefaultPriority
            : sqlite3_column_int(stmt, 4);
        candidates.push_back(std::move(candidate));
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR(rbStore, "fetchCandidates failed for bot %lld: %s",
                  static_cast<long long>(botId), sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return candidates;
}

// ── Transactions ────────────────────────────────────────────

bool SQLiteStore::beginTransaction()
{
    return execSql("BEGIN TRANSACTION");
}

bool SQLiteStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool SQLiteStore::rollbackTransaction()
{
    return execSql("ROLLBACK");
}

} // namespace rb
