#pragma once

#include <set>
#include <string>
#include <utility>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace rulegraph::db::memory {

/*
  Transaction = snapshot + write set

  Begin copies the committed state. Writes go to the copy and mark the
  row dirty. Commit fails with util::OptimisticLockConflict if any dirty
  row was committed by someone else after the snapshot was taken, then
  publishes only the dirty rows.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Table = MemoryRepository::Table;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable(Table table, const std::string& key);
  const MemoryRepository::State& View() const {
    return working_;
  }

  uint64_t NextSeq() {
    return repo_.NextSeq();
  }

 private:
  static std::string RevisionKey(Table table, const std::string& key);
  static uint64_t    RevisionOf(const MemoryRepository::State& state, const std::string& revision_key);

  MemoryRepository&                   repo_;
  MemoryRepository::State             working_;
  std::set<std::pair<Table, std::string>> dirty_;
  bool                                committed_   = false;
  bool                                rolled_back_ = false;
};

} // namespace rulegraph::db::memory
