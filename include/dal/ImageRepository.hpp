#pragma once

#include "dal/IImageRepository.hpp"

namespace dockops::dal {

class ConnectionPool;

/// Manages the images table; reference counting and stored manifest digests.
/// Class abbreviation: ir
class ImageRepository : public IImageRepository {
 public:
  explicit ImageRepository(ConnectionPool& cpPool);
  ~ImageRepository() override;

  void resetReferenceCounts() override;
  int incrementReference(const std::string& sName) override;
  std::vector<ImageRow> listAll() override;
  void updateDigest(const std::string& sName, const std::string& sDigest) override;
  bool deleteUnreferenced(const std::string& sName) override;
  void deleteAll() override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace dockops::dal
