/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace decai::incentive {

  enum class IncentiveError : uint8_t {
    InvalidConfig = 1,
    ClockRegression,
    TooEarly,
    InsufficientPayment,
    NothingToClaim,
    AlreadyClaimed,
    NoStanding,
    SelfReport,
    ModelAgrees,
    ModelDisagrees,
  };
  Q_ENUM_ERROR_CODE(IncentiveError) {
    using E = decltype(e);
    switch (e) {
      case E::InvalidConfig:
        return "Wait times must satisfy refund <= owner claim <= any address "
               "claim";
      case E::ClockRegression:
        return "Time reading is earlier than a previously recorded one";
      case E::TooEarly:
        return "Not enough time has passed";
      case E::InsufficientPayment:
        return "Paid amount is below the current submission cost";
      case E::NothingToClaim:
        return "There is no reward left to claim";
      case E::AlreadyClaimed:
        return "Deposit already claimed by this address";
      case E::NoStanding:
        return "Reporter has no validated contributions";
      case E::SelfReport:
        return "Cannot report own contribution";
      case E::ModelAgrees:
        return "The model agrees with the contribution";
      case E::ModelDisagrees:
        return "The model does not agree with the contribution";
    }
    abort();
  }

}  // namespace decai::incentive
