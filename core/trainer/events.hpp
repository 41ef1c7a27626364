/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/common.hpp"

namespace decai::trainer {

  // Samples are not kept by the ledger; these events are the only place
  // the full identifying tuple is published.

  template <typename Sample>
  struct ContributionAdded {
    primitives::ContributionKey key;
    Sample sample;
    primitives::Label label = 0;
    primitives::Timestamp time = 0;
    primitives::Address sender;
    primitives::Amount cost;
  };

  template <typename Sample>
  struct RefundIssued {
    primitives::ContributionKey key;
    Sample sample;
    primitives::Label label = 0;
    primitives::Timestamp added_time = 0;
    primitives::Address submitter;
    primitives::Amount amount;
    primitives::Timestamp claim_time = 0;
  };

  template <typename Sample>
  struct ReportRewarded {
    primitives::ContributionKey key;
    Sample sample;
    primitives::Label label = 0;
    primitives::Timestamp added_time = 0;
    primitives::Address original_author;
    primitives::Address reporter;
    primitives::Amount amount;
    primitives::Timestamp claim_time = 0;
  };

}  // namespace decai::trainer
