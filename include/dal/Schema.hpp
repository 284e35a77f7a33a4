#pragma once

namespace dockops::dal {

class ConnectionPool;

/// Create the images, stacks and source_cache tables if they do not exist.
/// Safe to call on every startup.
void ensureSchema(ConnectionPool& cpPool);

}  // namespace dockops::dal
