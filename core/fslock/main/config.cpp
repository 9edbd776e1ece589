/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fslock/main/config.hpp"

#include <boost/program_options.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include "config/fslock_config.hpp"

namespace fl::fslock {
  using config::configFileLock;

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

  Config Config::read(int argc, char **argv) {
    Config config;
    struct {
      char log_level;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc(
        "Usage: filelock [options] -- command [args...]\n"
        "Runs command while holding <folder>/<name>.lock");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("folder,f",
           po::value(&config.folder)->required(),
           "existing directory for lock file");
    option("name,n", po::value(&config.name)->required(), "lock name");
    option("config",
           po::value<boost::filesystem::path>(),
           "read options from file");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("log-file", po::value(&config.log_file), "also log to file");
    desc.add(configFileLock(config.lock));

    po::options_description hidden;
    hidden.add_options()(
        "command", po::value(&config.command)->composing(), "command to run");
    po::options_description all;
    all.add(desc).add(hidden);
    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
      po::store(po::command_line_parser(argc, argv)
                    .options(all)
                    .positional(positional)
                    .run(),
                vm);
      if (vm.count("help") != 0) {
        std::cerr << desc << std::endl;
        exit(EXIT_SUCCESS);
      }
      if (auto it{vm.find("config")}; it != vm.end()) {
        const auto &path{it->second.as<boost::filesystem::path>()};
        std::ifstream config_file{path.string()};
        if (!config_file.good()) {
          std::cerr << "Cannot read config file " << path << std::endl;
          exit(EXIT_FAILURE);
        }
        po::store(po::parse_config_file(config_file, desc), vm);
      }
      po::notify(vm);
    } catch (const po::error &e) {
      std::cerr << e.what() << std::endl << desc << std::endl;
      exit(EXIT_FAILURE);
    }
    if (config.command.empty()) {
      std::cerr << "Command is required" << std::endl << desc << std::endl;
      exit(EXIT_FAILURE);
    }

    config.log_level = getLogLevel(raw.log_level);
    return config;
  }
}  // namespace fl::fslock
