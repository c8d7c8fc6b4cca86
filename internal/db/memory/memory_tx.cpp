#include "memory_tx.hpp"

#include <stdexcept>

namespace glucolumin::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

std::shared_ptr<MemoryTransaction::VisitEntry>& MemoryTransaction::Touch(const std::string& visit_id) {
  if (auto it = working_.find(visit_id); it != working_.end()) {
    return it->second;
  }

  auto                         mutex = repo_.AcquireWriteLock(visit_id);
  std::unique_lock<std::mutex> lock(*mutex);
  locks_.emplace(visit_id, HeldLock{std::move(mutex), std::move(lock)});

  // loaded after locking so a concurrent writer's commit is seen
  auto  committed = repo_.CommittedEntry(visit_id);
  auto& entry     = working_[visit_id];
  if (committed) {
    entry = std::make_shared<VisitEntry>(*committed); // copy of this visit only
  }
  return entry;
}

const MemoryTransaction::VisitEntry* MemoryTransaction::Read(const std::string& visit_id) {
  if (read_only_) {
    auto it = pinned_.find(visit_id);
    if (it == pinned_.end()) {
      it = pinned_.emplace(visit_id, repo_.CommittedEntry(visit_id)).first;
    }
    return it->second.get();
  }

  if (auto it = working_.find(visit_id); it != working_.end()) {
    return it->second.get();
  }
  if (!repo_.CommittedEntry(visit_id)) {
    return nullptr;
  }
  return Touch(visit_id).get();
}

MemoryTransaction::VisitEntry* MemoryTransaction::Write(const std::string& visit_id) {
  if (read_only_) return nullptr;
  if (!working_.contains(visit_id) && !repo_.CommittedEntry(visit_id)) {
    return nullptr;
  }
  return Touch(visit_id).get();
}

MemoryTransaction::VisitEntry* MemoryTransaction::Create(const std::string& visit_id) {
  if (read_only_) return nullptr;
  auto& entry = Touch(visit_id);
  if (entry) return nullptr;
  entry = std::make_shared<VisitEntry>();
  return entry.get();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }

  if (!read_only_) {
    std::unique_lock lock(repo_.state_mutex_);
    for (auto& [visit_id, entry] : working_) {
      if (entry) repo_.visits_[visit_id] = std::move(entry);
    }
    for (const auto& scan : staged_scans_) {
      repo_.invalid_scans_[scan.id] = scan;
    }
  }

  committed_ = true;
  working_.clear();
  staged_scans_.clear();
  pinned_.clear();
  ReleaseLocks();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  working_.clear();
  staged_scans_.clear();
  pinned_.clear();
  ReleaseLocks();
}

void MemoryTransaction::ReleaseLocks() {
  for (auto& [visit_id, held] : locks_) {
    held.lock.unlock();
    repo_.ReleaseWriteLock(visit_id, std::move(held.mutex));
  }
  locks_.clear();
}

} // namespace glucolumin::db::memory
