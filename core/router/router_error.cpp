/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/router_error.hpp"

namespace fr::router {
  ErrorClass errorClass(RouterError e) {
    switch (e) {
      case RouterError::kInvalidFeeShare:
      case RouterError::kZeroTotalAllocation:
      case RouterError::kInvalidInvestorCount:
      case RouterError::kPolicyAlreadyExists:
      case RouterError::kPositionAlreadyExists:
      case RouterError::kPolicyNotFound:
      case RouterError::kPositionNotFound:
        return ErrorClass::kConfiguration;
      case RouterError::kQuoteOnlyValidationFailed:
      case RouterError::kBaseFeesDetected:
      case RouterError::kInvalidPoolConfiguration:
      case RouterError::kInvalidPositionOwnership:
      case RouterError::kDailyCapExceeded:
        return ErrorClass::kSafety;
      case RouterError::kInvalidPaginationSequence:
      case RouterError::kInvalidPagination:
      case RouterError::kAccountCountMismatch:
        return ErrorClass::kSequence;
      case RouterError::kCrankWindowNotReached:
        return ErrorClass::kWindow;
      case RouterError::kMathOverflow:
        return ErrorClass::kArithmetic;
      case RouterError::kInsufficientVestingData:
        return ErrorClass::kExternal;
    }
    return ErrorClass::kExternal;
  }

  ErrorClass errorClass(const std::error_code &ec) {
    if (ec.category() == make_error_code(RouterError{}).category()) {
      return errorClass(static_cast<RouterError>(ec.value()));
    }
    return ErrorClass::kExternal;
  }
}  // namespace fr::router

OUTCOME_CPP_DEFINE_CATEGORY(fr::router, RouterError, e) {
  using fr::router::RouterError;
  switch (e) {
    case RouterError::kInvalidFeeShare:
      return "RouterError: investor fee share exceeds 10000 basis points";
    case RouterError::kZeroTotalAllocation:
      return "RouterError: total investor allocation (Y0) must be positive";
    case RouterError::kInvalidInvestorCount:
      return "RouterError: investor count is zero or exceeds bitmap capacity";
    case RouterError::kPolicyAlreadyExists:
      return "RouterError: policy already exists for vault";
    case RouterError::kPositionAlreadyExists:
      return "RouterError: honorary position already exists for vault";
    case RouterError::kPolicyNotFound:
      return "RouterError: no policy for vault";
    case RouterError::kPositionNotFound:
      return "RouterError: no honorary position for vault";
    case RouterError::kQuoteOnlyValidationFailed:
      return "RouterError: pool configuration allows fees in the other asset";
    case RouterError::kBaseFeesDetected:
      return "RouterError: fees in the other asset detected during claim, "
             "distribution aborted";
    case RouterError::kInvalidPoolConfiguration:
      return "RouterError: pool configuration is not compatible with "
             "quote-only distribution";
    case RouterError::kInvalidPositionOwnership:
      return "RouterError: position not owned by the vault position owner";
    case RouterError::kDailyCapExceeded:
      return "RouterError: investor payouts would exceed the day limits";
    case RouterError::kInvalidPaginationSequence:
      return "RouterError: pages must be processed sequentially starting at "
             "cursor";
    case RouterError::kInvalidPagination:
      return "RouterError: invalid page start or page size";
    case RouterError::kAccountCountMismatch:
      return "RouterError: investor accounts do not match page";
    case RouterError::kCrankWindowNotReached:
      return "RouterError: 24-hour crank window not reached";
    case RouterError::kMathOverflow:
      return "RouterError: math overflow in distribution calculations";
    case RouterError::kInsufficientVestingData:
      return "RouterError: cannot read locked amount of vesting stream";
  }
  return "RouterError: unknown error";
}
