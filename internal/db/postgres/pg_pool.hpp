#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace vigil::db::postgres {

/*
  Bounded pool of libpqxx connections for PgRepository.

  A connection is handed to exactly one PgTransaction and comes back when
  the last shared_ptr to it drops. Every new connection gets the
  repository's prepared statements. Broken connections are discarded on
  release. Acquire() throws util::Unavailable when no connection frees up
  within acquire_timeout.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16,
                  std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(10000));

  // Creates tables and indexes; safe to run on every start.
  void ApplySchema();

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  const std::string               conninfo_;
  const std::size_t               max_connections_;
  const std::chrono::milliseconds acquire_timeout_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace vigil::db::postgres
