/**
 * @file visibility.cpp
 * @brief VisibilityResolver implementation
 */

#include "transaction/visibility.hpp"

#include "transaction/transaction.hpp"
#include "transaction/transaction_registry.hpp"

namespace mvccdb {

Version *VisibilityResolver::visible_version(const Transaction &txn,
                                             VersionChain &chain) const {
  return visible_version(txn, chain, txn.isolation_level());
}

Version *VisibilityResolver::visible_version(const Transaction &txn,
                                             VersionChain &chain,
                                             IsolationLevel level) const {
  for (Version *version : chain.newest_first()) {
    Verdict verdict = judge(*version, txn, level);
    if (verdict == Verdict::kSkip) {
      continue;
    }
    // The newest version with a visible creator decides for the record
    return verdict == Verdict::kVisible ? version : nullptr;
  }
  return nullptr;
}

bool VisibilityResolver::is_visible(const Version &version,
                                    const Transaction &txn,
                                    IsolationLevel level) const {
  return judge(version, txn, level) == Verdict::kVisible;
}

VisibilityResolver::Verdict
VisibilityResolver::judge(const Version &version, const Transaction &txn,
                          IsolationLevel level) const {
  switch (level) {
  case IsolationLevel::READ_UNCOMMITTED:
    return judge_read_uncommitted(version);
  case IsolationLevel::READ_COMMITTED:
    return judge_read_committed(version, txn);
  case IsolationLevel::REPEATABLE_READ:
  case IsolationLevel::SERIALIZABLE:
    return judge_in_snapshot(version, txn);
  }
  return Verdict::kSkip;
}

VisibilityResolver::Verdict
VisibilityResolver::judge_read_uncommitted(const Version &version) const {
  if (registry_.is_aborted(version.created_by)) {
    return Verdict::kSkip;
  }
  txn_id_t deleter = version.deleter();
  if (deleter == INVALID_TXN_ID || registry_.is_aborted(deleter)) {
    return Verdict::kVisible;
  }
  return Verdict::kHidden;
}

VisibilityResolver::Verdict
VisibilityResolver::judge_read_committed(const Version &version,
                                         const Transaction &txn) const {
  // Rule 1: creator must be me or committed
  if (version.created_by != txn.txn_id() &&
      !registry_.is_committed(version.created_by)) {
    return Verdict::kSkip;
  }

  // Rule 2: not deleted, or deleted by someone else who has not committed
  txn_id_t deleter = version.deleter();
  if (deleter == INVALID_TXN_ID ||
      (deleter != txn.txn_id() && !registry_.is_committed(deleter))) {
    return Verdict::kVisible;
  }
  return Verdict::kHidden;
}

VisibilityResolver::Verdict
VisibilityResolver::judge_in_snapshot(const Version &version,
                                      const Transaction &txn) const {
  const Snapshot *snapshot = txn.snapshot();
  if (snapshot == nullptr) {
    return judge_read_committed(version, txn);
  }

  if (version.created_by != txn.txn_id() &&
      !snapshot->contains(version.created_by)) {
    return Verdict::kSkip;
  }

  txn_id_t deleter = version.deleter();
  if (deleter == INVALID_TXN_ID ||
      (deleter != txn.txn_id() && !snapshot->contains(deleter))) {
    return Verdict::kVisible;
  }
  return Verdict::kHidden;
}

} // namespace mvccdb
