#pragma once

namespace glucolumin::db::sql {

/*
  Canonical SQL for the result store, SQLite dialect.
*/

// visits

#define GLUCOLUMIN_VISIT_COLUMNS                                                                                                         \
  "visit_id,patient_id,patient_name,age,sex,height_cm,weight_kg,bmi,skin_tone,blood_pressure,had_food,family_history,status,processing_trigger," \
  "created_at_ms,updated_at_ms,last_sample_at_ms,processing_started_at_ms,sample_count,last_sample_index,failure_reason,version"

static constexpr const char* INSERT_VISIT =
    "INSERT INTO visits(" GLUCOLUMIN_VISIT_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_VISIT =
    "SELECT " GLUCOLUMIN_VISIT_COLUMNS " FROM visits WHERE visit_id=?;";

static constexpr const char* SELECT_VISITS =
    "SELECT " GLUCOLUMIN_VISIT_COLUMNS " FROM visits ORDER BY visit_id;";

static constexpr const char* UPDATE_VISIT =
    "UPDATE visits SET patient_id=?,patient_name=?,age=?,sex=?,height_cm=?,weight_kg=?,bmi=?,skin_tone=?,blood_pressure=?,"
    "had_food=?,family_history=?,status=?,processing_trigger=?,created_at_ms=?,updated_at_ms=?,last_sample_at_ms=?,"
    "processing_started_at_ms=?,sample_count=?,last_sample_index=?,failure_reason=?,version=?"
    " WHERE visit_id=?;";

#undef GLUCOLUMIN_VISIT_COLUMNS

// raw samples

static constexpr const char* SELECT_LAST_SAMPLE_INDEX =
    "SELECT MAX(sample_index) FROM raw_samples WHERE visit_id=?;";

static constexpr const char* INSERT_SAMPLE =
    "INSERT INTO raw_samples(visit_id,sample_index,value) VALUES(?,?,?);";

static constexpr const char* SELECT_SAMPLES =
    "SELECT sample_index,value FROM raw_samples WHERE visit_id=? ORDER BY sample_index;";

// features

static constexpr const char* DELETE_FEATURES =
    "DELETE FROM visit_features WHERE visit_id=?;";

static constexpr const char* INSERT_FEATURE =
    "INSERT INTO visit_features(visit_id,position,name,value) VALUES(?,?,?,?);";

static constexpr const char* SELECT_FEATURES =
    "SELECT position,name,value FROM visit_features WHERE visit_id=? ORDER BY position;";

// results

static constexpr const char* INSERT_RESULT =
    "INSERT INTO clinical_results(visit_id,glucose_mg_dl,classification,label,advice,model_version,computed_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_RESULT =
    "SELECT visit_id,glucose_mg_dl,classification,label,advice,model_version,computed_at_ms"
    " FROM clinical_results WHERE visit_id=?;";

// invalid scans

static constexpr const char* INSERT_INVALID_SCAN =
    "INSERT INTO invalid_scans(visit_id,reason,value,recorded_at_ms) VALUES(?,?,?,?);";

static constexpr const char* SELECT_INVALID_SCANS =
    "SELECT id,visit_id,reason,value,recorded_at_ms FROM invalid_scans"
    " WHERE (?1 IS NULL OR visit_id=?1) ORDER BY id DESC LIMIT ?2;";

}
