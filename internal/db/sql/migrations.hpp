#pragma once

#include <string>
#include <vector>

namespace glucolumin::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Result store schema, in execution order. Idempotent.
const std::vector<std::string>& SchemaStatements();

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace glucolumin::db::sql
