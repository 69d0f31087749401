#pragma once

namespace rb {

constexpr int kCurrentSchemaVersion = 1;

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
)";

// Database-level pragmas, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x52424F54;
PRAGMA user_version = 1;
)";

constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS bots (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    slug TEXT UNIQUE NOT NULL,
    name TEXT NOT NULL,
    fallback_message TEXT DEFAULT 'Sorry, I didn''t understand that. Can you rephrase your question?',
    created_at TEXT NOT NULL,
    updated_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS qna (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    bot_id INTEGER NOT NULL REFERENCES bots(id) ON DELETE CASCADE,
    question TEXT NOT NULL,
    answer TEXT NOT NULL,
    keywords TEXT,
    priority INTEGER DEFAULT 1,
    created_at TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_qna_bot_priority ON qna(bot_id, priority DESC, id ASC);
)";

} // namespace rb
