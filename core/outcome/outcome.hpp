/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

// outcome::result<T>, outcome::success(), OUTCOME_TRY and Q_ENUM_ERROR_CODE
// come from qtils; every decai error enum is declared with Q_ENUM_ERROR_CODE
// in the header that owns it.
