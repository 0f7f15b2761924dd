/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/ranges.h>
#include <algorithm>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <sstream>

#include "cli/tree.hpp"
#include "cli/try.hpp"

namespace andamio::cli {
  constexpr int kExitSuccess{0};
  constexpr int kExitFailure{1};

  inline bool isDashDash(const std::string &s) {
    return s.size() == 2 && s[0] == '-' && s[1] == '-';
  }
  // note: returns first positional arg or end
  inline Argv::iterator hackBoost(po::variables_map &vm,
                                  const Opts &opts,
                                  Argv::iterator begin,
                                  Argv::iterator end) {
    po::parsed_options parsed{&opts};
    while (true) {
      if (begin == end) {
        break;
      }
      if (!isDash(*begin)) {
        break;
      }
      if (isDashDash(*begin)) {
        ++begin;
        break;
      }
      const auto it{std::find_if(begin + 1, end, isDash)};
      const auto options{
          po::command_line_parser{Argv{begin, it}}.options(opts).run().options};
      if (options.empty()) {
        break;
      }
      for (const auto &option : options) {
        parsed.options.emplace_back(option);
        if (option.string_key.empty()) {
          break;
        }
        begin += option.original_tokens.size();
      }
    }
    po::store(parsed, vm);
    return begin;
  }

  inline void printHelp(const std::vector<std::string> &cmds,
                        const Tree &tree,
                        const Opts &opts) {
    std::stringstream options;
    options << opts;
    fmt::print("name:\n  {}\n", fmt::join(cmds, " "));
    if (!tree.description.empty()) {
      fmt::print("description:\n  {}\n", tree.description);
    }
    fmt::print("options:\n{}", options.str());
    if (!tree.sub.empty()) {
      fmt::print("subcommands:\n");
      for (const auto &sub : tree.sub) {
        fmt::print("  {:<12}{}\n", sub.first, sub.second.description);
      }
    }
  }

  /**
   * Parses options of each command level, descends into subcommands and runs
   * the last command with remaining positional arguments.
   * @return process exit status
   */
  inline int run(std::string app, const Tree &_tree, Argv argv) {
    auto tree{&_tree};
    std::vector<std::string> cmds;
    cmds.emplace_back(std::move(app));
    ArgsMap argm;
    auto argv_it{argv.begin()};
    while (true) {
      auto args{tree->args()};
      auto option{args.opts.add_options()};
      option("help,h", "print help");
      po::variables_map vm;
      try {
        argv_it = hackBoost(vm, args.opts, argv_it, argv.end());
        if (vm.count("help") == 0) {
          po::notify(vm);
        }
      } catch (po::error &e) {
        fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
        return kExitFailure;
      }
      if (vm.count("help") != 0) {
        printHelp(cmds, *tree, args.opts);
        return kExitSuccess;
      }
      argm._.emplace(args._);
      if (argv_it != argv.end()) {
        auto sub_it{tree->sub.find(*argv_it)};
        if (sub_it != tree->sub.end()) {
          ++argv_it;
          cmds.emplace_back(sub_it->first);
          tree = &sub_it->second;
          continue;
        }
      }
      if (tree->run) {
        try {
          tree->run(argm, {argv_it, argv.end()});
          return kExitSuccess;
        } catch (ShowHelp &) {
        } catch (po::error &e) {
          fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
          return kExitFailure;
        } catch (CliError &e) {
          fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
          return kExitFailure;
        }
      }
      printHelp(cmds, *tree, args.opts);
      return kExitFailure;
    }
  }
  inline int run(std::string app,
                 const Tree &tree,
                 int argc,
                 const char *argv[]) {
    return run(std::move(app), tree, {argv + 1, argv + argc});
  }
}  // namespace andamio::cli
