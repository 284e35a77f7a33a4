#include "dal/StackRepository.hpp"

#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace dockops::dal {

namespace {

StackRow toStackRow(const pqxx::row& row) {
  StackRow srRow;
  srRow.iId = row[0].as<int64_t>();
  srRow.sName = row[1].as<std::string>();
  srRow.sRepositoryUrl = row[2].as<std::string>();
  srRow.sComposePath = row[3].as<std::string>();
  srRow.sHash = row[4].as<std::string>();
  srRow.status = common::stackStatusFromString(row[5].as<std::string>());
  return srRow;
}

}  // namespace

StackRepository::StackRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
StackRepository::~StackRepository() = default;

std::optional<StackRow> StackRepository::findByName(const std::string& sName,
                                                    const std::string& sRepositoryUrl) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT id, name, repository_url, compose_path, hash, status "
      "FROM stacks WHERE name = $1 AND repository_url = $2",
      pqxx::params{sName, sRepositoryUrl});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return toStackRow(result[0]);
}

void StackRepository::upsertDeclared(const std::string& sName,
                                     const std::string& sRepositoryUrl,
                                     const std::string& sComposePath) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "INSERT INTO stacks (name, repository_url, compose_path) VALUES ($1, $2, $3) "
      "ON CONFLICT (name, repository_url) DO UPDATE SET compose_path = EXCLUDED.compose_path",
      pqxx::params{sName, sRepositoryUrl, sComposePath});
  txn.commit();
}

void StackRepository::recordDeployment(const std::string& sName,
                                       const std::string& sRepositoryUrl,
                                       const std::string& sHash,
                                       common::StackStatus status) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  // compose_path is set by upsertDeclared; '' only if a deploy is recorded without one
  txn.exec(
      "INSERT INTO stacks (name, repository_url, compose_path, hash, status) "
      "VALUES ($1, $2, '', $3, $4) "
      "ON CONFLICT (name, repository_url) DO UPDATE "
      "SET hash = EXCLUDED.hash, status = EXCLUDED.status",
      pqxx::params{sName, sRepositoryUrl, sHash, common::toString(status)});
  txn.commit();
}

std::vector<StackRow> StackRepository::listAll() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT id, name, repository_url, compose_path, hash, status "
      "FROM stacks ORDER BY name, repository_url");
  txn.commit();

  std::vector<StackRow> vRows;
  vRows.reserve(result.size());
  for (const auto& row : result) {
    vRows.push_back(toStackRow(row));
  }
  return vRows;
}

void StackRepository::deleteAll() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec("DELETE FROM stacks");
  txn.commit();
}

}  // namespace dockops::dal
