#pragma once

namespace ragturn::db::sql {

/*
  Bootstrap DDL, applied in order at startup by the factory.
  Every statement is idempotent.
*/

static constexpr const char* SQLITE_SCHEMA_STATEMENTS[] = {
    "CREATE TABLE IF NOT EXISTS user_balances ("
    " owner_id TEXT PRIMARY KEY,"
    " balance_cents INTEGER NOT NULL DEFAULT 0 CHECK (balance_cents >= 0),"
    " lifetime_granted_cents INTEGER NOT NULL DEFAULT 0,"
    " lifetime_spent_cents INTEGER NOT NULL DEFAULT 0,"
    " updated_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS ledger_entries ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " owner_id TEXT NOT NULL,"
    " type TEXT NOT NULL CHECK (type IN ('grant','reserve','debit','release')),"
    " amount_cents INTEGER NOT NULL CHECK (amount_cents > 0),"
    " request_id TEXT, thread_id TEXT, message_id TEXT, model_id TEXT, provider TEXT,"
    " metadata_json TEXT NOT NULL DEFAULT '{}',"
    " created_at_ms INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS ledger_entries_owner_idx ON ledger_entries(owner_id, id);",

    "CREATE TABLE IF NOT EXISTS threads ("
    " id TEXT PRIMARY KEY,"
    " title TEXT NOT NULL,"
    " visibility TEXT NOT NULL CHECK (visibility IN ('org','private')),"
    " created_by_user_id TEXT NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS thread_participants ("
    " thread_id TEXT NOT NULL REFERENCES threads(id) ON DELETE CASCADE,"
    " user_id TEXT NOT NULL,"
    " PRIMARY KEY (thread_id, user_id));",

    "CREATE TABLE IF NOT EXISTS messages ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
    " id TEXT NOT NULL UNIQUE,"
    " thread_id TEXT NOT NULL REFERENCES threads(id) ON DELETE CASCADE,"
    " user_id TEXT,"
    " role TEXT NOT NULL,"
    " content TEXT NOT NULL,"
    " model_id TEXT, provider TEXT,"
    " input_tokens INTEGER NOT NULL DEFAULT 0,"
    " output_tokens INTEGER NOT NULL DEFAULT 0,"
    " total_tokens INTEGER NOT NULL DEFAULT 0,"
    " cost_cents INTEGER NOT NULL DEFAULT 0,"
    " billing_mode TEXT,"
    " usage_json TEXT,"
    " created_at_ms INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS messages_thread_idx ON messages(thread_id, seq);",

    "CREATE TABLE IF NOT EXISTS message_citations ("
    " message_id TEXT NOT NULL REFERENCES messages(id) ON DELETE CASCADE,"
    " rank INTEGER NOT NULL,"
    " chunk_id TEXT NOT NULL, doc_id TEXT NOT NULL, url TEXT NOT NULL, title TEXT NOT NULL, section TEXT,"
    " score REAL NOT NULL, snippet TEXT NOT NULL, multiplier REAL NOT NULL,"
    " PRIMARY KEY (message_id, rank));",

    "CREATE TABLE IF NOT EXISTS user_credentials ("
    " id TEXT PRIMARY KEY,"
    " owner_id TEXT NOT NULL,"
    " provider TEXT NOT NULL,"
    " label TEXT,"
    " encrypted_key TEXT NOT NULL,"
    " key_preview TEXT NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS audit_events ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " actor_user_id TEXT NOT NULL,"
    " action TEXT NOT NULL,"
    " target_type TEXT NOT NULL,"
    " target_id TEXT,"
    " metadata_json TEXT NOT NULL DEFAULT '{}',"
    " created_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS retrieval_signals ("
    " chunk_id TEXT PRIMARY KEY,"
    " doc_id TEXT NOT NULL,"
    " rating_count INTEGER NOT NULL DEFAULT 0,"
    " avg_rating REAL NOT NULL DEFAULT 0,"
    " low_rating_count INTEGER NOT NULL DEFAULT 0,"
    " high_rating_count INTEGER NOT NULL DEFAULT 0,"
    " confidence REAL NOT NULL DEFAULT 0,"
    " multiplier REAL NOT NULL DEFAULT 1,"
    " updated_at_ms INTEGER NOT NULL);",
};

static constexpr const char* POSTGRES_SCHEMA[] = {
    "CREATE TABLE IF NOT EXISTS user_balances ("
    " owner_id TEXT PRIMARY KEY,"
    " balance_cents BIGINT NOT NULL DEFAULT 0 CHECK (balance_cents >= 0),"
    " lifetime_granted_cents BIGINT NOT NULL DEFAULT 0,"
    " lifetime_spent_cents BIGINT NOT NULL DEFAULT 0,"
    " updated_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS ledger_entries ("
    " id BIGSERIAL PRIMARY KEY,"
    " owner_id TEXT NOT NULL,"
    " type TEXT NOT NULL CHECK (type IN ('grant','reserve','debit','release')),"
    " amount_cents BIGINT NOT NULL CHECK (amount_cents > 0),"
    " request_id TEXT, thread_id TEXT, message_id TEXT, model_id TEXT, provider TEXT,"
    " metadata_json JSONB NOT NULL DEFAULT '{}'::jsonb,"
    " created_at_ms BIGINT NOT NULL);",

    "CREATE INDEX IF NOT EXISTS ledger_entries_owner_idx ON ledger_entries(owner_id, id);",

    "CREATE TABLE IF NOT EXISTS threads ("
    " id TEXT PRIMARY KEY,"
    " title TEXT NOT NULL,"
    " visibility TEXT NOT NULL CHECK (visibility IN ('org','private')),"
    " created_by_user_id TEXT NOT NULL,"
    " created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS thread_participants ("
    " thread_id TEXT NOT NULL REFERENCES threads(id) ON DELETE CASCADE,"
    " user_id TEXT NOT NULL,"
    " PRIMARY KEY (thread_id, user_id));",

    "CREATE TABLE IF NOT EXISTS messages ("
    " seq BIGSERIAL PRIMARY KEY,"
    " id TEXT NOT NULL UNIQUE,"
    " thread_id TEXT NOT NULL REFERENCES threads(id) ON DELETE CASCADE,"
    " user_id TEXT,"
    " role TEXT NOT NULL,"
    " content TEXT NOT NULL,"
    " model_id TEXT, provider TEXT,"
    " input_tokens BIGINT NOT NULL DEFAULT 0,"
    " output_tokens BIGINT NOT NULL DEFAULT 0,"
    " total_tokens BIGINT NOT NULL DEFAULT 0,"
    " cost_cents BIGINT NOT NULL DEFAULT 0,"
    " billing_mode TEXT,"
    " usage_json JSONB,"
    " created_at_ms BIGINT NOT NULL);",

    "CREATE INDEX IF NOT EXISTS messages_thread_idx ON messages(thread_id, seq);",

    "CREATE TABLE IF NOT EXISTS message_citations ("
    " message_id TEXT NOT NULL REFERENCES messages(id) ON DELETE CASCADE,"
    " rank INTEGER NOT NULL,"
    " chunk_id TEXT NOT NULL, doc_id TEXT NOT NULL, url TEXT NOT NULL, title TEXT NOT NULL, section TEXT,"
    " score DOUBLE PRECISION NOT NULL, snippet TEXT NOT NULL, multiplier DOUBLE PRECISION NOT NULL,"
    " PRIMARY KEY (message_id, rank));",

    "CREATE TABLE IF NOT EXISTS user_credentials ("
    " id TEXT PRIMARY KEY,"
    " owner_id TEXT NOT NULL,"
    " provider TEXT NOT NULL,"
    " label TEXT,"
    " encrypted_key TEXT NOT NULL,"
    " key_preview TEXT NOT NULL,"
    " created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS audit_events ("
    " id BIGSERIAL PRIMARY KEY,"
    " actor_user_id TEXT NOT NULL,"
    " action TEXT NOT NULL,"
    " target_type TEXT NOT NULL,"
    " target_id TEXT,"
    " metadata_json JSONB NOT NULL DEFAULT '{}'::jsonb,"
    " created_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS retrieval_signals ("
    " chunk_id TEXT PRIMARY KEY,"
    " doc_id TEXT NOT NULL,"
    " rating_count BIGINT NOT NULL DEFAULT 0,"
    " avg_rating DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " low_rating_count BIGINT NOT NULL DEFAULT 0,"
    " high_rating_count BIGINT NOT NULL DEFAULT 0,"
    " confidence DOUBLE PRECISION NOT NULL DEFAULT 0,"
    " multiplier DOUBLE PRECISION NOT NULL DEFAULT 1,"
    " updated_at_ms BIGINT NOT NULL);",
};

} // namespace ragturn::db::sql
