#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace receiver::db::postgres {

/*
  Bounded set of connections to the receiver database.

  A PgTransaction holds one connection for its whole lifetime and hands
  it back when the shared_ptr is dropped. Each connection is created with
  the receiver statements prepared (get_receiver, get_receiver_by_name,
  insert_receiver, delete_receiver).

  Connections that come back closed are discarded, so a server restart
  costs one failed request per pooled connection rather than all of them.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  struct Options {
    std::size_t               max_connections = 16;
    std::chrono::milliseconds acquire_timeout{5000};
  };

  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);
  PgPool(std::string conninfo, Options options);

  // Throws pqxx::broken_connection when no connection frees up within
  // acquire_timeout or a new one cannot be opened.
  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t LiveConnections() const;

 private:
  std::unique_ptr<pqxx::connection> Connect() const;
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              GiveBack(pqxx::connection* conn);

  const std::string conninfo_;
  const Options     options_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_ = 0;
};

} // namespace receiver::db::postgres
