#pragma once

namespace ragturn::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  The Postgres backend prepares the same statements with $n placeholders
  in PgPool::PrepareStatements.
*/

// balances

static constexpr const char* SELECT_BALANCE =
    "SELECT owner_id,balance_cents,lifetime_granted_cents,lifetime_spent_cents,updated_at_ms"
    " FROM user_balances WHERE owner_id=?;";

static constexpr const char* GRANT_BALANCE =
    "INSERT INTO user_balances(owner_id,balance_cents,lifetime_granted_cents,lifetime_spent_cents,updated_at_ms)"
    " VALUES(?1,?2,?2,0,?3)"
    " ON CONFLICT(owner_id) DO UPDATE SET"
    " balance_cents=balance_cents+excluded.balance_cents,"
    " lifetime_granted_cents=lifetime_granted_cents+excluded.lifetime_granted_cents,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* DECREMENT_BALANCE_IF_SUFFICIENT =
    "UPDATE user_balances SET balance_cents=balance_cents-?1,updated_at_ms=?2"
    " WHERE owner_id=?3 AND balance_cents>=?1;";

static constexpr const char* SETTLE_BALANCE =
    "UPDATE user_balances SET balance_cents=balance_cents+?,lifetime_spent_cents=lifetime_spent_cents+?,updated_at_ms=?"
    " WHERE owner_id=?;";

// ledger

static constexpr const char* INSERT_LEDGER_ENTRY =
    "INSERT INTO ledger_entries(owner_id,type,amount_cents,request_id,thread_id,message_id,model_id,provider,metadata_json,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_LEDGER_ENTRIES =
    "SELECT id,owner_id,type,amount_cents,request_id,thread_id,message_id,model_id,provider,metadata_json,created_at_ms"
    " FROM ledger_entries WHERE owner_id=? ORDER BY id ASC;";

// threads

static constexpr const char* INSERT_THREAD =
    "INSERT INTO threads(id,title,visibility,created_by_user_id,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_THREAD =
    "SELECT id,title,visibility,created_by_user_id,created_at_ms,updated_at_ms"
    " FROM threads WHERE id=?;";

static constexpr const char* INSERT_THREAD_PARTICIPANT =
    "INSERT INTO thread_participants(thread_id,user_id) VALUES(?,?)"
    " ON CONFLICT(thread_id,user_id) DO NOTHING;";

static constexpr const char* SELECT_THREAD_PARTICIPANTS =
    "SELECT user_id FROM thread_participants WHERE thread_id=? ORDER BY user_id ASC;";

static constexpr const char* UPDATE_THREAD_TITLE =
    "UPDATE threads SET title=?,updated_at_ms=? WHERE id=?;";

// messages

static constexpr const char* INSERT_MESSAGE =
    "INSERT INTO messages(id,thread_id,user_id,role,content,model_id,provider,input_tokens,output_tokens,total_tokens,"
    "cost_cents,billing_mode,usage_json,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_RECENT_MESSAGES =
    "SELECT seq,id,thread_id,user_id,role,content,model_id,provider,input_tokens,output_tokens,total_tokens,"
    "cost_cents,billing_mode,usage_json,created_at_ms FROM ("
    " SELECT * FROM messages WHERE thread_id=? ORDER BY seq DESC LIMIT ?"
    ") ORDER BY seq ASC;";

static constexpr const char* INSERT_CITATION =
    "INSERT INTO message_citations(message_id,rank,chunk_id,doc_id,url,title,section,score,snippet,multiplier)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_CITATIONS =
    "SELECT message_id,rank,chunk_id,doc_id,url,title,section,score,snippet,multiplier"
    " FROM message_citations WHERE message_id=? ORDER BY rank ASC;";

// credentials

static constexpr const char* INSERT_CREDENTIAL =
    "INSERT INTO user_credentials(id,owner_id,provider,label,encrypted_key,key_preview,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_CREDENTIAL =
    "SELECT id,owner_id,provider,label,encrypted_key,key_preview,created_at_ms,updated_at_ms"
    " FROM user_credentials WHERE id=? AND owner_id=?;";

static constexpr const char* UPDATE_CREDENTIAL_SECRET =
    "UPDATE user_credentials SET encrypted_key=?,key_preview=?,updated_at_ms=? WHERE id=?;";

// audit

static constexpr const char* INSERT_AUDIT_EVENT =
    "INSERT INTO audit_events(actor_user_id,action,target_type,target_id,metadata_json,created_at_ms)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_AUDIT_EVENTS =
    "SELECT id,actor_user_id,action,target_type,target_id,metadata_json,created_at_ms"
    " FROM audit_events WHERE (?1='' OR action=?1) ORDER BY id ASC;";

// retrieval signals

static constexpr const char* UPSERT_RETRIEVAL_SIGNAL =
    "INSERT INTO retrieval_signals(chunk_id,doc_id,rating_count,avg_rating,low_rating_count,high_rating_count,"
    "confidence,multiplier,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(chunk_id) DO UPDATE SET"
    " doc_id=excluded.doc_id,"
    " rating_count=excluded.rating_count,"
    " avg_rating=excluded.avg_rating,"
    " low_rating_count=excluded.low_rating_count,"
    " high_rating_count=excluded.high_rating_count,"
    " confidence=excluded.confidence,"
    " multiplier=excluded.multiplier,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_RETRIEVAL_SIGNALS =
    "SELECT chunk_id,doc_id,rating_count,avg_rating,low_rating_count,high_rating_count,confidence,multiplier,updated_at_ms"
    " FROM retrieval_signals ORDER BY chunk_id ASC;";

} // namespace ragturn::db::sql
