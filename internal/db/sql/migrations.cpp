#include "internal/db/sql/migrations.hpp"

namespace glucolumin::db::sql {

const std::vector<std::string>& SchemaStatements() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS visits ("
      " visit_id TEXT PRIMARY KEY,"
      " patient_id TEXT NOT NULL,"
      " patient_name TEXT NOT NULL,"
      " age INTEGER NOT NULL,"
      " sex TEXT NOT NULL,"
      " height_cm REAL NOT NULL,"
      " weight_kg REAL NOT NULL,"
      " bmi REAL NOT NULL,"
      " skin_tone TEXT NOT NULL,"
      " blood_pressure TEXT NOT NULL,"
      " had_food INTEGER NOT NULL,"
      " family_history INTEGER NOT NULL,"
      " status INTEGER NOT NULL,"
      " processing_trigger INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " last_sample_at_ms INTEGER NOT NULL DEFAULT 0,"
      " processing_started_at_ms INTEGER NOT NULL DEFAULT 0,"
      " sample_count INTEGER NOT NULL DEFAULT 0,"
      " last_sample_index INTEGER NOT NULL DEFAULT -1,"
      " failure_reason TEXT NOT NULL DEFAULT '',"
      " version INTEGER NOT NULL DEFAULT 0);",

      "CREATE TABLE IF NOT EXISTS raw_samples ("
      " visit_id TEXT NOT NULL REFERENCES visits(visit_id) ON DELETE CASCADE,"
      " sample_index INTEGER NOT NULL,"
      " value REAL NOT NULL,"
      " PRIMARY KEY (visit_id, sample_index));",

      "CREATE TABLE IF NOT EXISTS visit_features ("
      " visit_id TEXT NOT NULL REFERENCES visits(visit_id) ON DELETE CASCADE,"
      " position INTEGER NOT NULL,"
      " name TEXT NOT NULL,"
      " value REAL NOT NULL,"
      " PRIMARY KEY (visit_id, position));",

      "CREATE TABLE IF NOT EXISTS clinical_results ("
      " visit_id TEXT PRIMARY KEY REFERENCES visits(visit_id) ON DELETE CASCADE,"
      " glucose_mg_dl REAL NOT NULL,"
      " classification INTEGER NOT NULL,"
      " label TEXT NOT NULL,"
      " advice TEXT NOT NULL,"
      " model_version TEXT NOT NULL,"
      " computed_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS invalid_scans ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " visit_id TEXT NOT NULL,"
      " reason TEXT NOT NULL,"
      " value REAL NOT NULL,"
      " recorded_at_ms INTEGER NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_visits_status ON visits(status);",
      "CREATE INDEX IF NOT EXISTS idx_invalid_scans_visit ON invalid_scans(visit_id);",
  };
  return kStatements;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
}

} // namespace glucolumin::db::sql
