/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/main/config.hpp"

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>

#include "clock/time.hpp"
#include "router/constants.hpp"
#include "router/fee_math.hpp"

namespace fr::router::sim {
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       InvestorConfig *,
                       long) {
    using namespace boost::program_options;
    auto &value{get_single_string(values)};
    std::vector<std::string> parts;
    size_t begin{0};
    while (true) {
      const auto colon{value.find(':', begin)};
      parts.push_back(value.substr(begin, colon - begin));
      if (colon == std::string::npos) {
        break;
      }
      begin = colon + 1;
    }
    if (parts.size() == 4 && !parts[0].empty()) {
      try {
        InvestorConfig investor{parts[0],
                                boost::lexical_cast<TokenAmount>(parts[1]),
                                boost::lexical_cast<int64_t>(parts[2]),
                                boost::lexical_cast<int64_t>(parts[3])};
        if (investor.start_day <= investor.end_day) {
          out = investor;
          return;
        }
      } catch (const boost::bad_lexical_cast &) {
      }
    }
    boost::throw_exception(invalid_option_value{value});
  }

  spdlog::level::level_enum getLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }

  Config Config::read(int argc, char *argv[]) {
    Config config;
    struct {
      char log_level;
      std::string start_time;
      boost::optional<boost::filesystem::path> config_path;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc("Fee router simulator options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("config", po::value(&raw.config_path), "read options from file");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("days",
           po::value(&config.days)->default_value(1),
           "number of distribution days");
    option("start-time",
           po::value(&raw.start_time)->default_value("2024-01-01"),
           "time of the first crank, YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ");
    option("page-size",
           po::value(&config.page_size)->default_value(kMaxPageSize),
           "investors per crank page");

    po::options_description vault_desc("Vault options");
    auto vault_option{vault_desc.add_options()};
    vault_option("vault", po::value(&config.vault)->default_value("vault"));
    vault_option("creator",
                 po::value(&config.creator_wallet)->default_value("creator"),
                 "creator wallet");
    vault_option("fee-share-bps",
                 po::value(&config.investor_fee_share_bps)->required(),
                 "investor fee share cap, basis points");
    vault_option("daily-cap",
                 po::value(&config.daily_cap),
                 "investor payout cap per day");
    vault_option("min-payout",
                 po::value(&config.min_payout)->default_value(0),
                 "minimal investor payout");
    vault_option("y0",
                 po::value(&config.y0_total_allocation),
                 "total investor allocation, sum of deposits by default");
    vault_option("investor",
                 po::value(&config.investors)->composing()->required(),
                 "wallet:deposited:start_day:end_day");
    desc.add(vault_desc);

    po::options_description pool_desc("Pool options");
    auto pool_option{pool_desc.add_options()};
    pool_option("pool", po::value(&config.pool)->default_value("pool"));
    pool_option("token-a", po::value(&config.token_a)->default_value("BASE"));
    pool_option("token-b", po::value(&config.token_b)->default_value("QUOTE"));
    pool_option("collect-fee-mode",
                po::value(&config.collect_fee_mode)->default_value(1),
                "0 both tokens, 1 only token b, 2 only token a");
    pool_option("quote", po::value(&config.quote_asset), "designated asset");
    pool_option("fees-per-day",
                po::value(&config.quote_fees_per_day)->default_value(0),
                "fees accrued in the designated asset per day");
    pool_option("base-fees-per-day",
                po::value(&config.base_fees_per_day)->default_value(0),
                "fees accrued in the other asset per day");
    desc.add(pool_desc);

    po::variables_map vm;
    po::store(parse_command_line(argc, argv, desc), vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    if (raw.config_path) {
      std::ifstream config_file{raw.config_path->string()};
      if (!config_file.good()) {
        std::cerr << "Cannot read config file " << *raw.config_path
                  << std::endl;
        exit(EXIT_FAILURE);
      }
      po::store(po::parse_config_file(config_file, desc), vm);
    }
    po::notify(vm);

    config.log_level = getLogLevel(raw.log_level);

    auto start_time{clock::unixTimeFromString(raw.start_time)};
    if (!start_time) {
      std::cerr << "Invalid start time " << raw.start_time << std::endl;
      exit(EXIT_FAILURE);
    }
    config.start_time = start_time.value();
    if (config.quote_asset.empty()) {
      config.quote_asset = config.token_b;
    }
    return config;
  }

  outcome::result<TokenAmount> Config::totalAllocation() const {
    if (y0_total_allocation) {
      return *y0_total_allocation;
    }
    TokenAmount total{0};
    for (const auto &investor : investors) {
      OUTCOME_TRYA(total, math::checkedAdd(total, investor.deposited));
    }
    return total;
  }
}  // namespace fr::router::sim
