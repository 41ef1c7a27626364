/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/impl/ledger_impl.hpp"

#include "ledger/ledger_error.hpp"
#include "primitives/math.hpp"

namespace decai::ledger {

  LedgerImpl::LedgerImpl(primitives::Address owner)
      : gate_(owner, "ledger"), log_(log::createLogger("Ledger", "ledger")) {}

  template <typename F>
  auto LedgerImpl::inspect(const primitives::ContributionKey &key,
                           primitives::Label label,
                           primitives::Timestamp time,
                           const primitives::Address &submitter,
                           F &&f) const
      -> outcome::result<decltype(f(std::declval<const Contribution &>()))> {
    using R = decltype(f(std::declval<const Contribution &>()));
    return records_.sharedAccess(
        [&](const Records &records) -> outcome::result<R> {
          auto it = records.find(key);
          if (it == records.end()
              or it->second.sender == primitives::Address{}) {
            return LedgerError::NotFound;
          }
          const auto &stored = it->second;
          // the key is a hash; guard against a commitment collision
          if (stored.time != time or stored.label != label
              or stored.sender != submitter) {
            return LedgerError::Mismatch;
          }
          return f(stored);
        });
  }

  outcome::result<void> LedgerImpl::record(
      const primitives::Address &caller,
      const primitives::ContributionKey &key,
      primitives::Label label,
      primitives::Timestamp time,
      const primitives::Address &submitter,
      const primitives::Amount &deposit) {
    return records_.exclusiveAccess(
        [&](Records &records) -> outcome::result<void> {
          OUTCOME_TRY(gate_.require(caller));
          auto it = records.find(key);
          if (it != records.end() and it->second.isLive()) {
            SL_VERBOSE(log_, "Key {:s} already holds a live record", key);
            return LedgerError::KeyCollision;
          }
          Contribution contribution{
              .label = label,
              .time = time,
              .sender = submitter,
              .initial_deposit = deposit,
              .claimable_amount = deposit,
              .num_claims = 0,
              .claimed_by = {},
          };
          records.insert_or_assign(key, std::move(contribution));
          SL_DEBUG(log_,
                   "Recorded {} from {} at {}, label {}, deposit {}",
                   key,
                   submitter,
                   time,
                   label,
                   deposit);
          return outcome::success();
        });
  }

  outcome::result<primitives::Amount> LedgerImpl::getClaimableAmount(
      const primitives::ContributionKey &key,
      primitives::Label label,
      primitives::Timestamp time,
      const primitives::Address &submitter) const {
    return inspect(key, label, time, submitter, [](const Contribution &c) {
      return c.claimable_amount;
    });
  }

  outcome::result<primitives::Amount> LedgerImpl::getInitialDeposit(
      const primitives::ContributionKey &key,
      primitives::Label label,
      primitives::Timestamp time,
      const primitives::Address &submitter) const {
    return inspect(key, label, time, submitter, [](const Contribution &c) {
      return c.initial_deposit;
    });
  }

  outcome::result<uint64_t> LedgerImpl::getNumClaims(
      const primitives::ContributionKey &key,
      primitives::Label label,
      primitives::Timestamp time,
      const primitives::Address &submitter) const {
    return inspect(key, label, time, submitter, [](const Contribution &c) {
      return c.num_claims;
    });
  }

  outcome::result<bool> LedgerImpl::hasClaimed(
      const primitives::ContributionKey &key,
      primitives::Label label,
      primitives::Timestamp time,
      const primitives::Address &submitter,
      const primitives::Address &claimant) const {
    return inspect(key, label, time, submitter, [&](const Contribution &c) {
      return c.claimed_by.contains(claimant);
    });
  }

  outcome::result<RefundClaim> LedgerImpl::claimRefund(
      const primitives::Address &caller,
      const primitives::ContributionKey &key,
      const primitives::Address &claimant) {
    return records_.exclusiveAccess(
        [&](Records &records) -> outcome::result<RefundClaim> {
          OUTCOME_TRY(gate_.require(caller));
          auto it = records.find(key);
          if (it == records.end()) {
            return LedgerError::NotFound;
          }
          auto &stored = it->second;
          RefundClaim claim{
              .claimable_amount = stored.claimable_amount,
              .claimed_by_claimant = stored.claimed_by.contains(claimant),
              .num_claims = stored.num_claims,
          };
          stored.claimable_amount = 0;
          stored.claimed_by.insert(claimant);
          ++stored.num_claims;
          SL_DEBUG(log_,
                   "Refund claim on {} by {}, drained {}",
                   key,
                   claimant,
                   claim.claimable_amount);
          return claim;
        });
  }

  outcome::result<ReportClaim> LedgerImpl::claimReport(
      const primitives::Address &caller,
      const primitives::ContributionKey &key,
      const primitives::Address &claimant) {
    return records_.exclusiveAccess(
        [&](Records &records) -> outcome::result<ReportClaim> {
          OUTCOME_TRY(gate_.require(caller));
          auto it = records.find(key);
          if (it == records.end()) {
            return LedgerError::NotFound;
          }
          auto &stored = it->second;
          ReportClaim claim{
              .initial_deposit = stored.initial_deposit,
              .claimable_amount = stored.claimable_amount,
              .claimed_by_claimant = stored.claimed_by.contains(claimant),
              .num_claims = stored.num_claims,
              .key = key,
          };
          stored.claimed_by.insert(claimant);
          ++stored.num_claims;
          SL_DEBUG(log_, "Report claim on {} by {}", key, claimant);
          return claim;
        });
  }

  outcome::result<void> LedgerImpl::debit(
      const primitives::Address &caller,
      const primitives::ContributionKey &key,
      const primitives::Amount &amount) {
    return records_.exclusiveAccess(
        [&](Records &records) -> outcome::result<void> {
          OUTCOME_TRY(gate_.require(caller));
          auto it = records.find(key);
          if (it == records.end()) {
            return LedgerError::NotFound;
          }
          auto &stored = it->second;
          OUTCOME_TRY(math::checked_sub(stored.claimable_amount,
                                        amount,
                                        LedgerError::InsufficientBalance));
          SL_DEBUG(log_,
                   "Debited {} from {}, {} left",
                   amount,
                   key,
                   stored.claimable_amount);
          return outcome::success();
        });
  }

  primitives::Address LedgerImpl::owner() const {
    return gate_.owner();
  }

  outcome::result<void> LedgerImpl::transferOwnership(
      const primitives::Address &caller, const primitives::Address &new_owner) {
    // under the records lock, so no mutation straddles a handover
    return records_.exclusiveAccess(
        [&](Records &) { return gate_.transfer(caller, new_owner); });
  }

  size_t LedgerImpl::size() const {
    return records_.sharedAccess(
        [](const Records &records) { return records.size(); });
  }

}  // namespace decai::ledger
