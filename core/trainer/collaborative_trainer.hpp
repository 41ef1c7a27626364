/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include <boost/assert.hpp>

#include "access/owner_gate.hpp"
#include "classifier/classifier.hpp"
#include "common/event_emitter.hpp"
#include "crypto/commitment.hpp"
#include "incentive/incentive_engine.hpp"
#include "ledger/ledger.hpp"
#include "log/logger.hpp"
#include "primitives/math.hpp"
#include "trainer/events.hpp"
#include "trainer/value_transfer.hpp"

namespace decai::trainer {

  /**
   * Entry point for participants. Sequences the incentive engine, the ledger
   * and the classifier, and moves value only after every state change of a
   * call has been committed. The trainer identity must own both the ledger
   * and the engine.
   *
   * Each public call holds one trainer-wide lock, so a submission or a claim
   * is evaluated against the state left by the previous call as a whole.
   * Events are delivered after that lock is released, so subscribers may
   * call back into the trainer.
   *
   * @tparam Sample sample representation, e.g. std::vector<int64_t> or a
   * fixed-size std::array<int64_t, N>
   */
  template <crypto::SampleRange Sample>
  class CollaborativeTrainer {
   public:
    CollaborativeTrainer(
        primitives::Address self,
        std::shared_ptr<ledger::Ledger> ledger,
        std::shared_ptr<incentive::IncentiveEngine> engine,
        std::shared_ptr<classifier::Classifier<Sample>> classifier,
        std::shared_ptr<ValueTransfer> value_transfer)
        : self_(self),
          ledger_(std::move(ledger)),
          engine_(std::move(engine)),
          classifier_(std::move(classifier)),
          value_transfer_(std::move(value_transfer)),
          log_(log::createLogger("CollaborativeTrainer", "trainer")) {
      BOOST_ASSERT(ledger_ != nullptr);
      BOOST_ASSERT(engine_ != nullptr);
      BOOST_ASSERT(classifier_ != nullptr);
      BOOST_ASSERT(value_transfer_ != nullptr);
    }

    const primitives::Address &address() const {
      return self_;
    }

    /**
     * Stakes a deposit for a new sample and trains the model with it.
     * Anything paid above the cost is returned to the sender.
     * @return the cost kept as deposit
     */
    outcome::result<primitives::Amount> addData(
        const primitives::Address &sender,
        const Sample &sample,
        primitives::Label label,
        const primitives::Amount &paid,
        primitives::Timestamp now) {
      std::optional<ContributionAdded<Sample>> event;
      auto res = addDataLocked(sender, sample, label, paid, now, event);
      if (event.has_value()) {
        contribution_added_.fire(event.value());
      }
      return res;
    }

    /**
     * Returns the whole remaining deposit to its submitter once the model
     * agrees with the sample
     */
    outcome::result<primitives::Amount> refund(
        const primitives::Address &submitter,
        const Sample &sample,
        primitives::Label label,
        primitives::Timestamp added_time,
        primitives::Timestamp now) {
      std::optional<RefundIssued<Sample>> event;
      auto res = refundLocked(submitter, sample, label, added_time, now, event);
      if (event.has_value()) {
        refund_issued_.fire(event.value());
      }
      return res;
    }

    /**
     * Claims (part of) the deposit of someone else's contribution: on merit
     * when the model disagrees with it, or as a sweep once it has been
     * unclaimed for long enough
     */
    outcome::result<primitives::Amount> report(
        const primitives::Address &reporter,
        const Sample &sample,
        primitives::Label label,
        primitives::Timestamp added_time,
        const primitives::Address &original_author,
        primitives::Timestamp now) {
      std::optional<ReportRewarded<Sample>> event;
      auto res = reportLocked(
          reporter, sample, label, added_time, original_author, now, event);
      if (event.has_value()) {
        report_rewarded_.fire(event.value());
      }
      return res;
    }

    /// Trains the model without staking, e.g. by a scripted oracle
    void train(const Sample &sample, primitives::Label label) {
      std::lock_guard lock(mutex_);
      classifier_->update(sample, label);
    }

    primitives::Label predict(const Sample &sample) const {
      std::lock_guard lock(mutex_);
      return classifier_->predict(sample);
    }

    outcome::result<primitives::Amount> nextAddDataCost(
        primitives::Timestamp now) const {
      return engine_->quoteCost(now);
    }

    common::EventEmitter<ContributionAdded<Sample>> &onContributionAdded() {
      return contribution_added_;
    }

    common::EventEmitter<RefundIssued<Sample>> &onRefundIssued() {
      return refund_issued_;
    }

    common::EventEmitter<ReportRewarded<Sample>> &onReportRewarded() {
      return report_rewarded_;
    }

   private:
    // Events are filled in once ledger and engine have committed, and fired
    // by the caller after the lock is released, whatever the transfer gives.

    outcome::result<primitives::Amount> addDataLocked(
        const primitives::Address &sender,
        const Sample &sample,
        primitives::Label label,
        const primitives::Amount &paid,
        primitives::Timestamp now,
        std::optional<ContributionAdded<Sample>> &event) {
      std::lock_guard lock(mutex_);
      OUTCOME_TRY(checkAuthority());

      // quote first, so a rejected record leaves the engine untouched
      OUTCOME_TRY(cost, engine_->quoteCost(now));
      if (paid < cost) {
        SL_VERBOSE(log_, "{} paid {}, cost is {}", sender, paid, cost);
        return incentive::IncentiveError::InsufficientPayment;
      }
      auto key = crypto::contributionKey(sample, label, now, sender);
      OUTCOME_TRY(ledger_->record(self_, key, label, now, sender, cost));

      auto charged = engine_->chargeForSubmission(self_, paid, now);
      if (charged.has_error()) {
        SL_CRITICAL(log_,
                    "Contribution {} recorded but not charged: {}",
                    key,
                    charged.error().message());
        return charged.error();
      }
      BOOST_ASSERT(charged.value() == cost);

      classifier_->update(sample, label);

      SL_DEBUG(log_, "Added {:s} from {} with cost {}", key, sender, cost);
      event = ContributionAdded<Sample>{
          .key = key,
          .sample = sample,
          .label = label,
          .time = now,
          .sender = sender,
          .cost = cost,
      };

      OUTCOME_TRY(excess, math::checkedSub(paid, cost));
      if (excess > 0) {
        OUTCOME_TRY(pay(sender, excess));
      }
      return cost;
    }

    outcome::result<primitives::Amount> refundLocked(
        const primitives::Address &submitter,
        const Sample &sample,
        primitives::Label label,
        primitives::Timestamp added_time,
        primitives::Timestamp now,
        std::optional<RefundIssued<Sample>> &event) {
      std::lock_guard lock(mutex_);
      OUTCOME_TRY(checkAuthority());

      auto key = crypto::contributionKey(sample, label, added_time, submitter);
      OUTCOME_TRY(
          claimable,
          ledger_->getClaimableAmount(key, label, added_time, submitter));
      OUTCOME_TRY(claimed,
                  ledger_->hasClaimed(
                      key, label, added_time, submitter, submitter));
      auto prediction = classifier_->predict(sample);

      OUTCOME_TRY(amount,
                  engine_->adjudicateRefund(
                      self_,
                      incentive::RefundRequest{
                          .claimant = submitter,
                          .submission_time = added_time,
                          .current_time = now,
                          .claimable_amount = claimable,
                          .already_claimed = claimed,
                          .prediction = prediction,
                          .label = label,
                      }));

      OUTCOME_TRY(claim, ledger_->claimRefund(self_, key, submitter));
      BOOST_ASSERT(claim.claimable_amount == amount);

      event = RefundIssued<Sample>{
          .key = key,
          .sample = sample,
          .label = label,
          .added_time = added_time,
          .submitter = submitter,
          .amount = amount,
          .claim_time = now,
      };

      OUTCOME_TRY(pay(submitter, amount));
      return amount;
    }

    outcome::result<primitives::Amount> reportLocked(
        const primitives::Address &reporter,
        const Sample &sample,
        primitives::Label label,
        primitives::Timestamp added_time,
        const primitives::Address &original_author,
        primitives::Timestamp now,
        std::optional<ReportRewarded<Sample>> &event) {
      std::lock_guard lock(mutex_);
      OUTCOME_TRY(checkAuthority());

      auto key =
          crypto::contributionKey(sample, label, added_time, original_author);
      OUTCOME_TRY(
          initial_deposit,
          ledger_->getInitialDeposit(key, label, added_time, original_author));
      OUTCOME_TRY(
          claimable,
          ledger_->getClaimableAmount(key, label, added_time, original_author));
      OUTCOME_TRY(claimed,
                  ledger_->hasClaimed(
                      key, label, added_time, original_author, reporter));
      auto prediction = classifier_->predict(sample);

      OUTCOME_TRY(reward,
                  engine_->adjudicateReport(
                      self_,
                      incentive::ReportRequest{
                          .reporter = reporter,
                          .submission_time = added_time,
                          .current_time = now,
                          .original_author = original_author,
                          .initial_deposit = initial_deposit,
                          .claimable_amount = claimable,
                          .already_claimed_by_reporter = claimed,
                          .prediction = prediction,
                          .label = label,
                      }));

      OUTCOME_TRY(ledger_->claimReport(self_, key, reporter));
      OUTCOME_TRY(ledger_->debit(self_, key, reward));

      event = ReportRewarded<Sample>{
          .key = key,
          .sample = sample,
          .label = label,
          .added_time = added_time,
          .original_author = original_author,
          .reporter = reporter,
          .amount = reward,
          .claim_time = now,
      };

      OUTCOME_TRY(pay(reporter, reward));
      return reward;
    }

    /// Ledger and engine must both still be gated by this trainer, otherwise
    /// a call could commit in one of them and be rejected by the other
    outcome::result<void> checkAuthority() const {
      if (ledger_->owner() != self_ or engine_->owner() != self_) {
        SL_ERROR(log_,
                 "Trainer {} no longer owns both the ledger ({}) and the "
                 "engine ({})",
                 self_,
                 ledger_->owner(),
                 engine_->owner());
        return access::AccessError::Unauthorized;
      }
      return outcome::success();
    }

    outcome::result<void> pay(const primitives::Address &to,
                              const primitives::Amount &amount) {
      auto res = value_transfer_->transfer(to, amount);
      if (res.has_error()) {
        SL_ERROR(log_,
                 "Transfer of {} to {} failed after commit: {}",
                 amount,
                 to,
                 res.error().message());
      }
      return res;
    }

    const primitives::Address self_;
    std::shared_ptr<ledger::Ledger> ledger_;
    std::shared_ptr<incentive::IncentiveEngine> engine_;
    std::shared_ptr<classifier::Classifier<Sample>> classifier_;
    std::shared_ptr<ValueTransfer> value_transfer_;
    common::EventEmitter<ContributionAdded<Sample>> contribution_added_;
    common::EventEmitter<RefundIssued<Sample>> refund_issued_;
    common::EventEmitter<ReportRewarded<Sample>> report_rewarded_;
    mutable std::mutex mutex_;
    log::Logger log_;
  };

}  // namespace decai::trainer
