#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dockops::dal {

/// Row type returned from image queries.
struct ImageRow {
  int64_t iId = 0;
  std::string sName;
  std::optional<std::string> oDigest;
  int iReferenceCount = 0;
};

/// Pure abstract interface over the images table.
class IImageRepository {
 public:
  virtual ~IImageRepository() = default;

  /// Set every row's reference_count to zero.
  virtual void resetReferenceCounts() = 0;

  /// Create the row with count 1, or increment an existing row by one.
  /// Returns the count after the increment.
  virtual int incrementReference(const std::string& sName) = 0;

  /// All rows ordered by name.
  virtual std::vector<ImageRow> listAll() = 0;

  virtual void updateDigest(const std::string& sName, const std::string& sDigest) = 0;

  /// Delete the row only while its reference_count is still zero.
  /// Returns false if no such row was deleted.
  virtual bool deleteUnreferenced(const std::string& sName) = 0;

  virtual void deleteAll() = 0;
};

}  // namespace dockops::dal
