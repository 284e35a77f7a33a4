#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dockops::dal {

/// Row type returned from stack queries.
struct StackRow {
  int64_t iId = 0;
  std::string sName;
  std::string sRepositoryUrl;
  std::string sComposePath;
  std::string sHash;
  common::StackStatus status = common::StackStatus::Stopped;
};

/// Pure abstract interface over the stacks table.
class IStackRepository {
 public:
  virtual ~IStackRepository() = default;

  virtual std::optional<StackRow> findByName(const std::string& sName,
                                             const std::string& sRepositoryUrl) = 0;

  /// Insert a stopped row with an empty hash, or refresh compose_path of an existing row.
  /// Hash and status of an existing row are left untouched.
  virtual void upsertDeclared(const std::string& sName, const std::string& sRepositoryUrl,
                              const std::string& sComposePath) = 0;

  /// Record the outcome of a deploy attempt.
  virtual void recordDeployment(const std::string& sName, const std::string& sRepositoryUrl,
                                const std::string& sHash, common::StackStatus status) = 0;

  /// All rows ordered by name.
  virtual std::vector<StackRow> listAll() = 0;

  virtual void deleteAll() = 0;
};

}  // namespace dockops::dal
