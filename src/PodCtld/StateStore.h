#pragma once

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>

#include <list>
#include <memory>
#include <string>

#include "CtldPublicDefs.h"
#include "podx/Lock.h"
#include "podx/Pointer.h"

namespace PodCtld {

/**
 * A table of records keyed by their id. Scan() visits the records in
 * insertion order, which is the order the scheduler walks the registry in.
 * @tparam Record must have `std::string id` and `uint64_t seq` members.
 * @attention Pointers returned by Get() are invalidated by Put() and Erase()
 * on the same table.
 */
template <typename Record>
class RecordTable {
 public:
  bool Contains(const std::string& id) const {
    return m_id_seq_map_.contains(id);
  }

  Record* Get(const std::string& id) {
    auto it = m_id_seq_map_.find(id);
    if (it == m_id_seq_map_.end()) return nullptr;
    return &m_records_.at(it->second);
  }

  const Record* Get(const std::string& id) const {
    auto it = m_id_seq_map_.find(id);
    if (it == m_id_seq_map_.end()) return nullptr;
    return &m_records_.at(it->second);
  }

  /**
   * Insert a new record or overwrite the record with the same id. A new
   * record is given the next sequence number; an overwritten one keeps its
   * position.
   */
  Record& Put(Record record) {
    auto it = m_id_seq_map_.find(record.id);
    if (it != m_id_seq_map_.end()) {
      record.seq = it->second;
      Record& stored = m_records_.at(it->second);
      stored = std::move(record);
      return stored;
    }

    record.seq = m_next_seq_++;
    m_id_seq_map_.emplace(record.id, record.seq);
    auto [rec_it, ok] = m_records_.emplace(record.seq, std::move(record));
    return rec_it->second;
  }

  bool Erase(const std::string& id) {
    auto it = m_id_seq_map_.find(id);
    if (it == m_id_seq_map_.end()) return false;

    m_records_.erase(it->second);
    m_id_seq_map_.erase(it);
    return true;
  }

  // fn(Record&). Must not insert into or erase from this table.
  template <typename Fn>
  void Scan(Fn&& fn) {
    for (auto&& [seq, record] : m_records_) fn(record);
  }

  template <typename Fn>
  void Scan(Fn&& fn) const {
    for (auto&& [seq, record] : m_records_) fn(record);
  }

  size_t Size() const { return m_records_.size(); }

  void Clear() {
    m_records_.clear();
    m_id_seq_map_.clear();
    m_next_seq_ = 0;
  }

 private:
  absl::btree_map<uint64_t /*seq*/, Record> m_records_;
  absl::flat_hash_map<std::string /*id*/, uint64_t /*seq*/> m_id_seq_map_;
  uint64_t m_next_seq_{0};
};

/**
 * Everything the control plane persists: the node table, the pod table and
 * the settings map.
 */
struct ClusterState {
  RecordTable<NodeRecord> nodes;
  RecordTable<PodRecord> pods;
  ClusterSettings settings;

  /**
   * Unassign every pod running on `node_id`, set them pending and give their
   * cpu back to the node.
   * @return the ids of the evicted pods.
   */
  std::list<std::string> EvictPodsOnNode(const std::string& node_id);
};

/**
 * The store of the cluster state. All access goes through the
 * ClusterStatePtr returned by GetClusterStatePtr(), which holds the single
 * store-wide lock for as long as it lives. The lock is recursive, so a
 * component holding the pointer may call into another component that
 * acquires it again.
 */
class StateStoreInterface {
 public:
  using Mutex = util::recursive_mutex;
  using LockGuard = util::recursive_lock_guard;

  using ClusterStatePtr = util::ScopeExclusivePtr<ClusterState, Mutex>;

  virtual ~StateStoreInterface() = default;

  virtual ClusterStatePtr GetClusterStatePtr() = 0;

  /**
   * Drop all nodes and pods and start over with `settings`.
   */
  virtual void Reset(const ClusterSettings& settings) = 0;

 protected:
  StateStoreInterface() = default;
};

class StateStoreInMemoryImpl final : public StateStoreInterface {
 public:
  StateStoreInMemoryImpl() = default;
  ~StateStoreInMemoryImpl() override = default;

  ClusterStatePtr GetClusterStatePtr() override;

  void Reset(const ClusterSettings& settings) override;

 private:
  ClusterState m_state_;
  Mutex m_mtx_;
};

}  // namespace PodCtld
