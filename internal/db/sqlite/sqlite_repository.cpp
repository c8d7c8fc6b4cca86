#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace glucolumin::db::sqlite {

using glucolumin::db::ErrorCode;
using glucolumin::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

// Reads have no Result channel; a storage failure must not look like "no rows".
[[noreturn]] void ThrowReadFailure(sqlite3* db, const char* what) {
    throw std::runtime_error(std::string("sqlite ") + what + ": " + sqlite3_errmsg(db));
}

void RequirePrepared(sqlite3* db, const Statement& st, const char* what) {
    if (!st.ok()) ThrowReadFailure(db, what);
}

// true on SQLITE_ROW, false on SQLITE_DONE, throws otherwise.
bool StepRow(sqlite3* db, sqlite3_stmt* st, const char* what) {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    ThrowReadFailure(db, what);
}

Result PrepareFailed(sqlite3* db) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
}

Result RequireWritable(const SqliteTransaction& tx) {
    if (tx.IsReadOnly()) {
        return Result::Err(ErrorCode::ReadOnly, "write attempted in a read-only transaction");
    }
    return Result::Ok();
}

// Binds every column except visit_id starting at `first`; returns the next index.
int BindVisitBody(sqlite3_stmt* st, int first, const model::VisitRecord& r) {
    int i = first;
    BindText(st, i++, r.patient_id);
    BindText(st, i++, r.patient_name);
    BindI32(st, i++, r.age);
    BindText(st, i++, r.sex);
    BindDouble(st, i++, r.height_cm);
    BindDouble(st, i++, r.weight_kg);
    BindDouble(st, i++, r.bmi);
    BindText(st, i++, r.skin_tone);
    BindText(st, i++, r.blood_pressure);
    BindI32(st, i++, r.had_food ? 1 : 0);
    BindI32(st, i++, r.family_history ? 1 : 0);
    BindI32(st, i++, static_cast<int>(r.status));
    BindI32(st, i++, static_cast<int>(r.trigger));
    BindU64(st, i++, r.created_at_ms);
    BindU64(st, i++, r.updated_at_ms);
    BindU64(st, i++, r.last_sample_at_ms);
    BindU64(st, i++, r.processing_started_at_ms);
    BindU64(st, i++, r.sample_count);
    BindI64(st, i++, r.last_sample_index);
    BindText(st, i++, r.failure_reason);
    BindU64(st, i++, r.version);
    return i;
}

model::VisitRecord ReadVisitRow(sqlite3_stmt* st) {
    model::VisitRecord r;
    r.visit_id = ColText(st, 0);
    r.patient_id = ColText(st, 1);
    r.patient_name = ColText(st, 2);
    r.age = ColI32(st, 3);
    r.sex = ColText(st, 4);
    r.height_cm = ColDouble(st, 5);
    r.weight_kg = ColDouble(st, 6);
    r.bmi = ColDouble(st, 7);
    r.skin_tone = ColText(st, 8);
    r.blood_pressure = ColText(st, 9);
    r.had_food = ColI32(st, 10) != 0;
    r.family_history = ColI32(st, 11) != 0;
    r.status = static_cast<glucolumin::v1::VisitStatus>(ColI32(st, 12));
    r.trigger = static_cast<glucolumin::v1::ProcessingTrigger>(ColI32(st, 13));
    r.created_at_ms = ColU64(st, 14);
    r.updated_at_ms = ColU64(st, 15);
    r.last_sample_at_ms = ColU64(st, 16);
    r.processing_started_at_ms = ColU64(st, 17);
    r.sample_count = ColU64(st, 18);
    r.last_sample_index = ColI64(st, 19);
    r.failure_reason = ColText(st, 20);
    r.version = ColU64(st, 21);
    return r;
}

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
public:
    explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {}

    void ExecuteSQL(const std::string& sql) override { db_.Exec(sql); }

private:
    SqliteDB& db_;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::Bootstrap() {
    std::lock_guard lock(db_->Mutex());
    SqliteMigrationExecutor executor(*db_);
    sql::RunMigrations(executor, sql::SchemaStatements());
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginReadOnly() {
    return std::make_unique<SqliteTransaction>(db_, true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (const int ext = sqlite3_extended_errcode(db);
                ext == SQLITE_CONSTRAINT_PRIMARYKEY || ext == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::ReadOnly, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Visits
// ------------------------------------------------------------------

Result SqliteRepository::InsertVisit(Transaction& t, const model::VisitRecord& r) {
    auto& tx = TX(t);
    if (auto writable = RequireWritable(tx); !writable) return writable;
    auto* db = tx.Handle();

    Statement st(db, sql::INSERT_VISIT);
    if (!st.ok()) return PrepareFailed(db);

    BindText(st.get(), 1, r.visit_id);
    BindVisitBody(st.get(), 2, r);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::VisitRecord>
SqliteRepository::GetVisit(Transaction& t, const std::string& visit_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_VISIT);
    RequirePrepared(db, st, "get visit");

    BindText(st.get(), 1, visit_id);
    if (!StepRow(db, st.get(), "get visit")) return std::nullopt;

    return ReadVisitRow(st.get());
}

std::vector<model::VisitRecord> SqliteRepository::ListVisits(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::VisitRecord> out;
    Statement st(db, sql::SELECT_VISITS);
    RequirePrepared(db, st, "list visits");

    while (StepRow(db, st.get(), "list visits")) {
        out.push_back(ReadVisitRow(st.get()));
    }
    return out;
}

Result SqliteRepository::UpdateVisit(Transaction& t, const model::VisitRecord& r) {
    auto& tx = TX(t);
    if (auto writable = RequireWritable(tx); !writable) return writable;
    auto* db = tx.Handle();

    Statement st(db, sql::UPDATE_VISIT);
    if (!st.ok()) return PrepareFailed(db);

    const int next = BindVisitBody(st.get(), 1, r);
    BindText(st.get(), next, r.visit_id);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "visit " + r.visit_id);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Raw samples
// ------------------------------------------------------------------

Result SqliteRepository::AppendSamples(Transaction& t, const std::string& visit_id,
                                       const std::vector<model::RawSampleRecord>& samples) {
    auto& tx = TX(t);
    if (auto writable = RequireWritable(tx); !writable) return writable;
    auto* db = tx.Handle();

    if (!GetVisit(t, visit_id)) return Result::Err(ErrorCode::NotFound, "visit " + visit_id);

    std::optional<uint64_t> last;
    {
        Statement q(db, sql::SELECT_LAST_SAMPLE_INDEX);
        if (!q.ok()) return PrepareFailed(db);
        BindText(q.get(), 1, visit_id);
        if (StepRow(db, q.get(), "last sample index") && sqlite3_column_type(q.get(), 0) != SQLITE_NULL) {
            last = ColU64(q.get(), 0);
        }
    }

    Statement st(db, sql::INSERT_SAMPLE);
    if (!st.ok()) return PrepareFailed(db);

    for (const auto& sample : samples) {
        if (last && sample.sample_index <= *last) {
            return Result::Err(ErrorCode::ConstraintViolation,
                               "sample index " + std::to_string(sample.sample_index) + " does not increase");
        }
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        BindText(st.get(), 1, visit_id);
        BindU64(st.get(), 2, sample.sample_index);
        BindDouble(st.get(), 3, sample.value);

        auto res = Translate(db, sqlite3_step(st.get()));
        if (!res) return res;
        last = sample.sample_index;
    }
    return Result::Ok();
}

std::vector<model::RawSampleRecord>
SqliteRepository::ReadSamples(Transaction& t, const std::string& visit_id) {
    auto* db = TX(t).Handle();

    std::vector<model::RawSampleRecord> out;
    Statement st(db, sql::SELECT_SAMPLES);
    RequirePrepared(db, st, "read samples");

    BindText(st.get(), 1, visit_id);
    while (StepRow(db, st.get(), "read samples")) {
        out.push_back({ColU64(st.get(), 0), ColDouble(st.get(), 1)});
    }
    return out;
}

// ------------------------------------------------------------------
// Features / results
// ------------------------------------------------------------------

Result SqliteRepository::UpsertFeatures(Transaction& t, const std::string& visit_id,
                                        const std::vector<model::FeatureRecord>& features) {
    auto& tx = TX(t);
    if (auto writable = RequireWritable(tx); !writable) return writable;
    auto* db = tx.Handle();

    if (!GetVisit(t, visit_id)) return Result::Err(ErrorCode::NotFound, "visit " + visit_id);

    {
        Statement del(db, sql::DELETE_FEATURES);
        if (!del.ok()) return PrepareFailed(db);
        BindText(del.get(), 1, visit_id);
        auto res = Translate(db, sqlite3_step(del.get()));
        if (!res) return res;
    }

    Statement st(db, sql::INSERT_FEATURE);
    if (!st.ok()) return PrepareFailed(db);

    for (const auto& feature : features) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        BindText(st.get(), 1, visit_id);
        BindU64(st.get(), 2, feature.position);
        BindText(st.get(), 3, feature.name);
        BindDouble(st.get(), 4, feature.value);

        auto res = Translate(db, sqlite3_step(st.get()));
        if (!res) return res;
    }
    return Result::Ok();
}

std::vector<model::FeatureRecord>
SqliteRepository::GetFeatures(Transaction& t, const std::string& visit_id) {
    auto* db = TX(t).Handle();

    std::vector<model::FeatureRecord> out;
    Statement st(db, sql::SELECT_FEATURES);
    RequirePrepared(db, st, "get features");

    BindText(st.get(), 1, visit_id);
    while (StepRow(db, st.get(), "get features")) {
        model::FeatureRecord r;
        r.position = static_cast<uint32_t>(ColU64(st.get(), 0));
        r.name = ColText(st.get(), 1);
        r.value = ColDouble(st.get(), 2);
        out.push_back(std::move(r));
    }
    return out;
}

Result SqliteRepository::InsertResult(Transaction& t, const model::ResultRecord& r) {
    auto& tx = TX(t);
    if (auto writable = RequireWritable(tx); !writable) return writable;
    auto* db = tx.Handle();

    if (!GetVisit(t, r.visit_id)) return Result::Err(ErrorCode::NotFound, "visit " + r.visit_id);

    Statement st(db, sql::INSERT_RESULT);
    if (!st.ok()) return PrepareFailed(db);

    BindText(st.get(), 1, r.visit_id);
    BindDouble(st.get(), 2, r.glucose_mg_dl);
    BindI32(st.get(), 3, static_cast<int>(r.classification));
    BindText(st.get(), 4, r.label);
    BindText(st.get(), 5, r.advice);
    BindText(st.get(), 6, r.model_version);
    BindU64(st.get(), 7, r.computed_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ResultRecord>
SqliteRepository::GetResult(Transaction& t, const std::string& visit_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_RESULT);
    RequirePrepared(db, st, "get result");

    BindText(st.get(), 1, visit_id);
    if (!StepRow(db, st.get(), "get result")) return std::nullopt;

    model::ResultRecord r;
    r.visit_id = ColText(st.get(), 0);
    r.glucose_mg_dl = ColDouble(st.get(), 1);
    r.classification = static_cast<glucolumin::v1::Classification>(ColI32(st.get(), 2));
    r.label = ColText(st.get(), 3);
    r.advice = ColText(st.get(), 4);
    r.model_version = ColText(st.get(), 5);
    r.computed_at_ms = ColU64(st.get(), 6);
    return r;
}

// ------------------------------------------------------------------
// Invalid scans
// ------------------------------------------------------------------

Result SqliteRepository::InsertInvalidScan(Transaction& t, model::InvalidScanRecord& r) {
    auto& tx = TX(t);
    if (auto writable = RequireWritable(tx); !writable) return writable;
    auto* db = tx.Handle();

    Statement st(db, sql::INSERT_INVALID_SCAN);
    if (!st.ok()) return PrepareFailed(db);

    BindText(st.get(), 1, r.visit_id);
    BindText(st.get(), 2, r.reason);
    BindDouble(st.get(), 3, r.value);
    BindU64(st.get(), 4, r.recorded_at_ms);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return res;
}

std::vector<model::InvalidScanRecord>
SqliteRepository::ListInvalidScans(Transaction& t, const std::optional<std::string>& visit_id, std::size_t limit) {
    auto* db = TX(t).Handle();

    std::vector<model::InvalidScanRecord> out;
    Statement st(db, sql::SELECT_INVALID_SCANS);
    RequirePrepared(db, st, "list invalid scans");

    if (visit_id) {
        BindText(st.get(), 1, *visit_id);
    } else {
        sqlite3_bind_null(st.get(), 1);
    }
    BindI64(st.get(), 2, limit == 0 ? -1 : static_cast<int64_t>(limit));

    while (StepRow(db, st.get(), "list invalid scans")) {
        model::InvalidScanRecord r;
        r.id = ColU64(st.get(), 0);
        r.visit_id = ColText(st.get(), 1);
        r.reason = ColText(st.get(), 2);
        r.value = ColDouble(st.get(), 3);
        r.recorded_at_ms = ColU64(st.get(), 4);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace glucolumin::db::sqlite
