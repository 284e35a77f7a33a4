#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dockops::dal {

/// Row type returned from source cache queries.
struct SourceCacheRow {
  int64_t iId = 0;
  std::string sUrl;
  std::chrono::system_clock::time_point tpLastSyncedAt;
};

/// Pure abstract interface over the source_cache table.
class ISourceCacheRepository {
 public:
  virtual ~ISourceCacheRepository() = default;

  virtual std::optional<SourceCacheRow> findByUrl(const std::string& sUrl) = 0;
  virtual void upsert(const std::string& sUrl, std::chrono::system_clock::time_point tpSyncedAt) = 0;

  /// All rows, most recently synced first.
  virtual std::vector<SourceCacheRow> listAll() = 0;

  virtual void deleteAll() = 0;
};

}  // namespace dockops::dal
