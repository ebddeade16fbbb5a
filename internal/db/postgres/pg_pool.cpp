#include "pg_pool.hpp"

namespace ragturn::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("select_balance",
               "SELECT owner_id,balance_cents,lifetime_granted_cents,lifetime_spent_cents,updated_at_ms "
               "FROM user_balances WHERE owner_id=$1");

  conn.prepare("grant_balance",
               "INSERT INTO user_balances(owner_id,balance_cents,lifetime_granted_cents,lifetime_spent_cents,updated_at_ms) "
               "VALUES($1,$2,$2,0,$3) "
               "ON CONFLICT(owner_id) DO UPDATE SET "
               "balance_cents=user_balances.balance_cents+EXCLUDED.balance_cents,"
               "lifetime_granted_cents=user_balances.lifetime_granted_cents+EXCLUDED.lifetime_granted_cents,"
               "updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("decrement_balance_if_sufficient",
               "UPDATE user_balances SET balance_cents=balance_cents-$1,updated_at_ms=$2 "
               "WHERE owner_id=$3 AND balance_cents>=$1");

  conn.prepare("settle_balance",
               "UPDATE user_balances SET balance_cents=balance_cents+$1,lifetime_spent_cents=lifetime_spent_cents+$2,updated_at_ms=$3 "
               "WHERE owner_id=$4");

  conn.prepare("insert_ledger_entry",
               "INSERT INTO ledger_entries(owner_id,type,amount_cents,request_id,thread_id,message_id,model_id,provider,metadata_json,created_at_ms) "
               "VALUES($1,$2,$3,NULLIF($4,''),NULLIF($5,''),NULLIF($6,''),NULLIF($7,''),NULLIF($8,''),$9::jsonb,$10) RETURNING id");

  conn.prepare("select_ledger_entries",
               "SELECT id,owner_id,type,amount_cents,COALESCE(request_id,''),COALESCE(thread_id,''),COALESCE(message_id,''),"
               "COALESCE(model_id,''),COALESCE(provider,''),metadata_json::text,created_at_ms "
               "FROM ledger_entries WHERE owner_id=$1 ORDER BY id ASC");

  conn.prepare("insert_thread",
               "INSERT INTO threads(id,title,visibility,created_by_user_id,created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6)");

  conn.prepare("select_thread", "SELECT id,title,visibility,created_by_user_id,created_at_ms,updated_at_ms FROM threads WHERE id=$1");

  conn.prepare("insert_thread_participant",
               "INSERT INTO thread_participants(thread_id,user_id) VALUES($1,$2) ON CONFLICT(thread_id,user_id) DO NOTHING");

  conn.prepare("select_thread_participants", "SELECT user_id FROM thread_participants WHERE thread_id=$1 ORDER BY user_id ASC");

  conn.prepare("update_thread_title", "UPDATE threads SET title=$2,updated_at_ms=$3 WHERE id=$1");

  conn.prepare("insert_message",
               "INSERT INTO messages(id,thread_id,user_id,role,content,model_id,provider,input_tokens,output_tokens,total_tokens,"
               "cost_cents,billing_mode,usage_json,created_at_ms) "
               "VALUES($1,$2,NULLIF($3,''),$4,$5,NULLIF($6,''),NULLIF($7,''),$8,$9,$10,$11,NULLIF($12,''),NULLIF($13,'')::jsonb,$14) "
               "RETURNING seq");

  conn.prepare("select_recent_messages",
               "SELECT seq,id,thread_id,user_id,role,content,model_id,provider,input_tokens,output_tokens,total_tokens,"
               "cost_cents,billing_mode,usage_json,created_at_ms FROM ("
               " SELECT seq,id,thread_id,COALESCE(user_id,'') AS user_id,role,content,COALESCE(model_id,'') AS model_id,"
               " COALESCE(provider,'') AS provider,input_tokens,output_tokens,total_tokens,cost_cents,"
               " COALESCE(billing_mode,'') AS billing_mode,COALESCE(usage_json::text,'') AS usage_json,created_at_ms"
               " FROM messages WHERE thread_id=$1 ORDER BY seq DESC LIMIT $2"
               ") recent ORDER BY seq ASC");

  conn.prepare("insert_citation",
               "INSERT INTO message_citations(message_id,rank,chunk_id,doc_id,url,title,section,score,snippet,multiplier) "
               "VALUES($1,$2,$3,$4,$5,$6,NULLIF($7,''),$8,$9,$10)");

  conn.prepare("select_citations",
               "SELECT message_id,rank,chunk_id,doc_id,url,title,COALESCE(section,''),score,snippet,multiplier "
               "FROM message_citations WHERE message_id=$1 ORDER BY rank ASC");

  conn.prepare("insert_credential",
               "INSERT INTO user_credentials(id,owner_id,provider,label,encrypted_key,key_preview,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,NULLIF($4,''),$5,$6,$7,$8)");

  conn.prepare("select_credential",
               "SELECT id,owner_id,provider,COALESCE(label,''),encrypted_key,key_preview,created_at_ms,updated_at_ms "
               "FROM user_credentials WHERE id=$1 AND owner_id=$2");

  conn.prepare("update_credential_secret", "UPDATE user_credentials SET encrypted_key=$2,key_preview=$3,updated_at_ms=$4 WHERE id=$1");

  conn.prepare("insert_audit_event",
               "INSERT INTO audit_events(actor_user_id,action,target_type,target_id,metadata_json,created_at_ms) "
               "VALUES($1,$2,$3,NULLIF($4,''),$5::jsonb,$6) RETURNING id");

  conn.prepare("select_audit_events",
               "SELECT id,actor_user_id,action,target_type,COALESCE(target_id,''),metadata_json::text,created_at_ms "
               "FROM audit_events WHERE ($1='' OR action=$1) ORDER BY id ASC");

  conn.prepare("upsert_retrieval_signal",
               "INSERT INTO retrieval_signals(chunk_id,doc_id,rating_count,avg_rating,low_rating_count,high_rating_count,"
               "confidence,multiplier,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) "
               "ON CONFLICT(chunk_id) DO UPDATE SET doc_id=EXCLUDED.doc_id,rating_count=EXCLUDED.rating_count,"
               "avg_rating=EXCLUDED.avg_rating,low_rating_count=EXCLUDED.low_rating_count,"
               "high_rating_count=EXCLUDED.high_rating_count,confidence=EXCLUDED.confidence,"
               "multiplier=EXCLUDED.multiplier,updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("select_retrieval_signals",
               "SELECT chunk_id,doc_id,rating_count,avg_rating,low_rating_count,high_rating_count,confidence,multiplier,updated_at_ms "
               "FROM retrieval_signals ORDER BY chunk_id ASC");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace ragturn::db::postgres
