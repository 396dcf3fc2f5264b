/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace fr::router {

  /**
   * @brief Fee router errors
   */
  enum class RouterError {
    kInvalidFeeShare = 1,
    kZeroTotalAllocation,
    kInvalidInvestorCount,
    kPolicyAlreadyExists,
    kPositionAlreadyExists,
    kPolicyNotFound,
    kPositionNotFound,

    kQuoteOnlyValidationFailed,
    kBaseFeesDetected,
    kInvalidPoolConfiguration,
    kInvalidPositionOwnership,
    kDailyCapExceeded,

    kInvalidPaginationSequence,
    kInvalidPagination,
    kAccountCountMismatch,

    kCrankWindowNotReached,

    kMathOverflow,

    kInsufficientVestingData,
  };

  /**
   * Failure taxonomy. Every RouterError belongs to exactly one class.
   */
  enum class ErrorClass {
    /// bad policy parameters or duplicate setup, rejected with no state
    kConfiguration,
    /// fee accounting would be wrong, fatal for the call
    kSafety,
    /// wrong page boundaries, retriable with pageStart read from the cursor
    kSequence,
    /// crank before the 24 hour gate, retriable later
    kWindow,
    kArithmetic,
    /// collaborator could not answer
    kExternal,
  };

  ErrorClass errorClass(RouterError e);

  /**
   * Classifies an error code. Codes of other categories are external.
   */
  ErrorClass errorClass(const std::error_code &ec);

}  // namespace fr::router

OUTCOME_HPP_DECLARE_ERROR(fr::router, RouterError);
