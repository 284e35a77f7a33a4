#pragma once

#include "dal/ISourceCacheRepository.hpp"

namespace dockops::dal {

class ConnectionPool;

/// Manages the source_cache table; one row per successfully synced URL.
/// Class abbreviation: scr
class SourceCacheRepository : public ISourceCacheRepository {
 public:
  explicit SourceCacheRepository(ConnectionPool& cpPool);
  ~SourceCacheRepository() override;

  std::optional<SourceCacheRow> findByUrl(const std::string& sUrl) override;
  void upsert(const std::string& sUrl, std::chrono::system_clock::time_point tpSyncedAt) override;
  std::vector<SourceCacheRow> listAll() override;
  void deleteAll() override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace dockops::dal
