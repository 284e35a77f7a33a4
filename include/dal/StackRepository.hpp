#pragma once

#include "dal/IStackRepository.hpp"

namespace dockops::dal {

class ConnectionPool;

/// Manages the stacks table; declared stacks and their last deploy outcome.
/// Class abbreviation: str
class StackRepository : public IStackRepository {
 public:
  explicit StackRepository(ConnectionPool& cpPool);
  ~StackRepository() override;

  std::optional<StackRow> findByName(const std::string& sName,
                                     const std::string& sRepositoryUrl) override;
  void upsertDeclared(const std::string& sName, const std::string& sRepositoryUrl,
                      const std::string& sComposePath) override;
  void recordDeployment(const std::string& sName, const std::string& sRepositoryUrl,
                        const std::string& sHash, common::StackStatus status) override;
  std::vector<StackRow> listAll() override;
  void deleteAll() override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace dockops::dal
