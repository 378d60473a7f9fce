#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace rulegraph::db::memory {

namespace {

template <typename Map>
void PublishRow(Map& dst, const Map& src, const std::string& key) {
  auto it = src.find(key);
  if (it == src.end()) {
    dst.erase(key);
  } else {
    dst[key] = it->second;
  }
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

uint64_t MemoryTransaction::RevisionOf(const MemoryRepository::State& state, const std::string& revision_key) {
  auto it = state.revisions.find(revision_key);
  return it == state.revisions.end() ? 0 : it->second;
}

std::string MemoryTransaction::RevisionKey(Table table, const std::string& key) {
  return std::to_string(static_cast<int>(table)) + "/" + key;
}

MemoryRepository::State& MemoryTransaction::Mutable(Table table, const std::string& key) {
  dirty_.emplace(table, key);
  return working_;
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);

  for (const auto& [table, key] : dirty_) {
    const auto revision_key = RevisionKey(table, key);
    if (RevisionOf(repo_.committed_, revision_key) != RevisionOf(working_, revision_key)) {
      throw util::OptimisticLockConflict("transaction conflict: row " + key + " was modified by a concurrent transaction");
    }
  }

  auto& target = repo_.committed_;
  for (const auto& [table, key] : dirty_) {
    switch (table) {
      case Table::kEntity:
        PublishRow(target.entities, working_.entities, key);
        break;
      case Table::kVariable:
        PublishRow(target.variables, working_.variables, key);
        break;
      case Table::kCondition:
        PublishRow(target.conditions, working_.conditions, key);
        break;
      case Table::kEffect:
        PublishRow(target.effects, working_.effects, key);
        break;
      case Table::kExecution:
        PublishRow(target.executions, working_.executions, key);
        break;
    }
    ++target.revisions[RevisionKey(table, key)];
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  dirty_.clear();
  rolled_back_ = true;
}

} // namespace rulegraph::db::memory
