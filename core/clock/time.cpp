/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/time.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(fr::clock, TimeFromStringError, e) {
  using fr::clock::TimeFromStringError;
  if (e == TimeFromStringError::kInvalidFormat) {
    return "TimeFromStringError: input has invalid format";
  }
  return "TimeFromStringError: unknown error";
}

namespace fr::clock {
  namespace {
    const boost::posix_time::ptime kUnixZero{boost::gregorian::date(1970, 1, 1)};

    constexpr size_t kDateLength{10};
    constexpr size_t kDateTimeLength{20};

    outcome::result<boost::posix_time::ptime> parse(const std::string &str) {
      try {
        if (str.size() == kDateLength) {
          return boost::posix_time::ptime{
              boost::gregorian::from_simple_string(str)};
        }
        if (str.size() == kDateTimeLength && str.back() == 'Z') {
          return boost::posix_time::from_iso_extended_string(
              str.substr(0, str.size() - 1));
        }
      } catch (const boost::bad_lexical_cast &) {
        return TimeFromStringError::kInvalidFormat;
      } catch (const std::out_of_range &) {
        // date_time reports out of range fields (month 13, day 32)
        return TimeFromStringError::kInvalidFormat;
      }
      return TimeFromStringError::kInvalidFormat;
    }
  }  // namespace

  std::string unixTimeToString(UnixTime time) {
    return boost::posix_time::to_iso_extended_string(
               kUnixZero + boost::posix_time::seconds{time.count()})
           + "Z";
  }

  outcome::result<UnixTime> unixTimeFromString(const std::string &str) {
    OUTCOME_TRY(ptime, parse(str));
    if (ptime.is_special()) {
      return TimeFromStringError::kInvalidFormat;
    }
    return UnixTime{(ptime - kUnixZero).total_seconds()};
  }
}  // namespace fr::clock
