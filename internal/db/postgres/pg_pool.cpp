#include "pg_pool.hpp"

namespace circulation::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_copy",
               "SELECT copy_id, book_id, status, COALESCE(current_loan_id, ''), updated_at_ms "
               "FROM copies WHERE copy_id=$1");

  conn.prepare("transition_copy",
               "UPDATE copies SET status=$2, current_loan_id=NULLIF($3, ''), updated_at_ms=$6 "
               "WHERE copy_id=$1 AND status=$4 AND COALESCE(current_loan_id, '')=$5");

  conn.prepare("find_active_loan",
               "SELECT loan_id, copy_id, user_id, status, checked_out_at_ms, due_at_ms, returned_at_ms, renewal_count "
               "FROM loans WHERE copy_id=$1 AND status=1");

  conn.prepare("get_idempotency",
               "SELECT idem_key, operation, fingerprint, status, result, created_at_ms, completed_at_ms, expires_at_ms "
               "FROM idempotency_records WHERE idem_key=$1");
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
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
      cv_.notify_one();
      return;
    }
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace circulation::db::postgres
