#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace glucolumin::db::memory {

/*
  Write transaction = per-visit writer locks + private copies of the visit
  entries it touches. Locks are taken on first touch and held until commit
  or rollback, in touch order.

  Read-only transaction = committed entries pinned on first read, so
  repeated reads of one visit stay consistent.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using VisitEntry = MemoryRepository::VisitEntry;

  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsReadOnly() const override {
    return read_only_;
  }

  // Current view of a visit, own writes included; nullptr if absent.
  const VisitEntry* Read(const std::string& visit_id);

  // Writable copy of an existing visit; nullptr if absent or read-only.
  VisitEntry* Write(const std::string& visit_id);

  // Locks the id and installs a fresh entry. nullptr if it already exists.
  VisitEntry* Create(const std::string& visit_id);

  // Ids touched by this write transaction, with their current entry.
  const std::map<std::string, std::shared_ptr<VisitEntry>>& Staged() const {
    return working_;
  }

  void StageInvalidScan(const model::InvalidScanRecord& record) {
    staged_scans_.push_back(record);
  }
  const std::vector<model::InvalidScanRecord>& StagedInvalidScans() const {
    return staged_scans_;
  }

 private:
  struct HeldLock {
    std::shared_ptr<std::mutex>  mutex;
    std::unique_lock<std::mutex> lock;
  };

  // Locks visit_id and loads its committed entry into working_.
  std::shared_ptr<VisitEntry>& Touch(const std::string& visit_id);
  void                         ReleaseLocks();

  MemoryRepository& repo_;
  bool              read_only_;
  bool              committed_   = false;
  bool              rolled_back_ = false;

  std::map<std::string, HeldLock>                     locks_;
  std::map<std::string, std::shared_ptr<VisitEntry>>  working_;
  std::vector<model::InvalidScanRecord>               staged_scans_;

  std::map<std::string, MemoryRepository::EntryPtr> pinned_;
};

} // namespace glucolumin::db::memory
