#include "pg_pool.hpp"

#include <exception>

namespace warehouse::db::postgres {

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
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
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
  conn.prepare("get_bin",
               "SELECT bin_id, capacity, current_usage, location_code "
               "FROM bins WHERE bin_id=$1");

  conn.prepare("list_bins",
               "SELECT bin_id, capacity, current_usage, location_code "
               "FROM bins ORDER BY bin_id");

  conn.prepare("insert_bin",
               "INSERT INTO bins(bin_id,capacity,current_usage,location_code) "
               "VALUES($1,$2,$3,$4)");

  conn.prepare("update_bin_usage", "UPDATE bins SET current_usage=$2 WHERE bin_id=$1");

  conn.prepare("insert_shipment_log",
               "INSERT INTO shipment_logs(tracking_id,bin_id,timestamp,status) "
               "VALUES($1,$2,$3,$4)");

  conn.prepare("list_shipment_logs", "SELECT tracking_id, bin_id, timestamp, status FROM shipment_logs ORDER BY seq");
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

} // namespace warehouse::db::postgres
