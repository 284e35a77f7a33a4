#include "dal/ImageRepository.hpp"

#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace dockops::dal {

ImageRepository::ImageRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
ImageRepository::~ImageRepository() = default;

void ImageRepository::resetReferenceCounts() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec("UPDATE images SET reference_count = 0");
  txn.commit();
}

int ImageRepository::incrementReference(const std::string& sName) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  // Single statement so concurrent markers can never lose an increment
  auto result = txn.exec(
      "INSERT INTO images (name, reference_count) VALUES ($1, 1) "
      "ON CONFLICT (name) DO UPDATE SET reference_count = images.reference_count + 1 "
      "RETURNING reference_count",
      pqxx::params{sName});
  txn.commit();
  return result.one_row()[0].as<int>();
}

std::vector<ImageRow> ImageRepository::listAll() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT id, name, digest, reference_count FROM images ORDER BY name");
  txn.commit();

  std::vector<ImageRow> vRows;
  vRows.reserve(result.size());
  for (const auto& row : result) {
    ImageRow irRow;
    irRow.iId = row[0].as<int64_t>();
    irRow.sName = row[1].as<std::string>();
    if (!row[2].is_null()) {
      irRow.oDigest = row[2].as<std::string>();
    }
    irRow.iReferenceCount = row[3].as<int>();
    vRows.push_back(std::move(irRow));
  }
  return vRows;
}

void ImageRepository::updateDigest(const std::string& sName, const std::string& sDigest) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec("UPDATE images SET digest = $2 WHERE name = $1",
           pqxx::params{sName, sDigest});
  txn.commit();
}

bool ImageRepository::deleteUnreferenced(const std::string& sName) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "DELETE FROM images WHERE name = $1 AND reference_count = 0",
      pqxx::params{sName});
  txn.commit();
  return result.affected_rows() > 0;
}

void ImageRepository::deleteAll() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec("DELETE FROM images");
  txn.commit();
}

}  // namespace dockops::dal
