/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <fmt/format.h>

#include "clock/time.hpp"
#include "common/logger.hpp"
#include "common/outcome_fmt.hpp"
#include "router/main/simulator.hpp"

namespace fr::router::sim {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("simulator");
      return logger.get();
    }
  }  // namespace

  int main(const Config &config) {
    common::setLogLevel(config.log_level);
    Simulator simulator{config};
    if (auto r = simulator.setup(); !r) {
      log()->error("Cannot set up vault {}: {:#}", config.vault, r.error());
      return EXIT_FAILURE;
    }

    fmt::print("{:>4} {:>20} {:>6} {:>12} {:>12} {:>12}\n",
               "day",
               "time",
               "pages",
               "claimed",
               "investors",
               "creator");
    for (uint32_t day = 0; day < config.days; ++day) {
      auto result{simulator.runDay()};
      if (!result) {
        log()->error("Day {} failed: {:#}", day, result.error());
        return EXIT_FAILURE;
      }
      fmt::print("{:>4} {:>20} {:>6} {:>12} {:>12} {:>12}\n",
                 result.value().day,
                 clock::unixTimeToString(config.start_time + day * clock::kDay),
                 result.value().pages,
                 result.value().claimed,
                 result.value().investors_distributed,
                 result.value().creator_payout);
    }

    fmt::print("\nbalances\n");
    for (const auto &investor : config.investors) {
      OUTCOME_EXCEPT(amount, simulator.balance(investor.wallet));
      fmt::print("{:>24} {:>12}\n", investor.wallet, amount);
    }
    OUTCOME_EXCEPT(creator, simulator.balance(config.creator_wallet));
    fmt::print("{:>24} {:>12}\n", config.creator_wallet, creator);
    return EXIT_SUCCESS;
  }
}  // namespace fr::router::sim

int main(int argc, char *argv[]) {
  auto config{fr::router::sim::Config::read(argc, argv)};
  return fr::router::sim::main(config);
}
