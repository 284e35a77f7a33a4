#include "dal/SourceCacheRepository.hpp"

#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace dockops::dal {

namespace {

SourceCacheRow toSourceCacheRow(const pqxx::row& row) {
  SourceCacheRow scRow;
  scRow.iId = row[0].as<int64_t>();
  scRow.sUrl = row[1].as<std::string>();
  scRow.tpLastSyncedAt = std::chrono::system_clock::time_point(
      std::chrono::seconds(row[2].as<int64_t>()));
  return scRow;
}

}  // namespace

SourceCacheRepository::SourceCacheRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
SourceCacheRepository::~SourceCacheRepository() = default;

std::optional<SourceCacheRow> SourceCacheRepository::findByUrl(const std::string& sUrl) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT id, url, EXTRACT(EPOCH FROM last_synced_at)::bigint "
      "FROM source_cache WHERE url = $1",
      pqxx::params{sUrl});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return toSourceCacheRow(result[0]);
}

void SourceCacheRepository::upsert(const std::string& sUrl,
                                   std::chrono::system_clock::time_point tpSyncedAt) {
  const auto iEpoch =
      std::chrono::duration_cast<std::chrono::seconds>(tpSyncedAt.time_since_epoch()).count();

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "INSERT INTO source_cache (url, last_synced_at) VALUES ($1, to_timestamp($2)) "
      "ON CONFLICT (url) DO UPDATE SET last_synced_at = EXCLUDED.last_synced_at",
      pqxx::params{sUrl, static_cast<int64_t>(iEpoch)});
  txn.commit();
}

std::vector<SourceCacheRow> SourceCacheRepository::listAll() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT id, url, EXTRACT(EPOCH FROM last_synced_at)::bigint "
      "FROM source_cache ORDER BY last_synced_at DESC");
  txn.commit();

  std::vector<SourceCacheRow> vRows;
  vRows.reserve(result.size());
  for (const auto& row : result) {
    vRows.push_back(toSourceCacheRow(row));
  }
  return vRows;
}

void SourceCacheRepository::deleteAll() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec("DELETE FROM source_cache");
  txn.commit();
}

}  // namespace dockops::dal
