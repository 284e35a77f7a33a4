#include "dal/Schema.hpp"

#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace dockops::dal {

void ensureSchema(ConnectionPool& cpPool) {
  auto cg = cpPool.checkout();
  pqxx::work txn(*cg);

  txn.exec(
      "CREATE TABLE IF NOT EXISTS images ("
      "  id BIGSERIAL PRIMARY KEY,"
      "  name TEXT NOT NULL UNIQUE,"
      "  digest TEXT,"
      "  reference_count INTEGER NOT NULL DEFAULT 0 CHECK (reference_count >= 0)"
      ")");

  txn.exec(
      "CREATE TABLE IF NOT EXISTS stacks ("
      "  id BIGSERIAL PRIMARY KEY,"
      "  name TEXT NOT NULL,"
      "  repository_url TEXT NOT NULL,"
      "  compose_path TEXT NOT NULL,"
      "  hash TEXT NOT NULL DEFAULT '',"
      "  status TEXT NOT NULL DEFAULT 'stopped' "
      "    CHECK (status IN ('deployed', 'stopped', 'error')),"
      "  UNIQUE (name, repository_url)"
      ")");

  txn.exec(
      "CREATE TABLE IF NOT EXISTS source_cache ("
      "  id BIGSERIAL PRIMARY KEY,"
      "  url TEXT NOT NULL UNIQUE,"
      "  last_synced_at TIMESTAMPTZ NOT NULL"
      ")");

  txn.commit();
  common::Logger::get()->debug("State store schema verified");
}

}  // namespace dockops::dal
