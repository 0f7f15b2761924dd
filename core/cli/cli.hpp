/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <map>
#include <memory>
#include <typeindex>
#include <vector>

#include "cli/try.hpp"

#define CLI_BOOL(NAME, DESCRIPTION)                               \
  struct {                                                        \
    bool v{};                                                     \
    void operator()(Opts &opts) {                                 \
      opts.add_options()(NAME, po::bool_switch(&v), DESCRIPTION); \
    }                                                             \
    operator bool() const {                                       \
      return v;                                                   \
    }                                                             \
  }

#define CLI_DEFAULT(NAME, DESCRIPTION, TYPE, INIT)          \
  struct {                                                  \
    TYPE v INIT;                                            \
    void operator()(Opts &opts) {                           \
      opts.add_options()(NAME, po::value(&v), DESCRIPTION); \
    }                                                       \
    auto &operator*() const {                               \
      return v;                                             \
    }                                                       \
    auto &operator*() {                                     \
      return v;                                             \
    }                                                       \
    auto *operator->() const {                              \
      return &v;                                            \
    }                                                       \
    auto *operator->() {                                    \
      return &v;                                            \
    }                                                       \
  }

#define CLI_OPTIONAL(NAME, DESCRIPTION, TYPE)                              \
  struct {                                                                 \
    boost::optional<TYPE> v;                                               \
    void operator()(Opts &opts) {                                          \
      opts.add_options()(NAME, po::value(&v), DESCRIPTION);                \
    }                                                                      \
    operator bool() const {                                                \
      return v.operator bool();                                            \
    }                                                                      \
    void check() const {                                                   \
      if (!v) {                                                            \
        throw ::andamio::cli::CliError{                                    \
            "--{} argument is required but missing", NAME};                \
      }                                                                    \
    }                                                                      \
    auto &operator*() const {                                              \
      check();                                                             \
      return *v;                                                           \
    }                                                                      \
    auto &operator*() {                                                    \
      check();                                                             \
      return *v;                                                           \
    }                                                                      \
    auto *operator->() const {                                             \
      return &**this;                                                      \
    }                                                                      \
    auto *operator->() {                                                   \
      return &**this;                                                      \
    }                                                                      \
  }

#define CLI_OPTS() ::andamio::cli::Opts opts()
#define CLI_RUN()                       \
  static ::andamio::cli::RunResult run( \
      ::andamio::cli::ArgsMap &argm, Args &args, ::andamio::cli::Argv &&argv)
#define CLI_NO_RUN() constexpr static std::nullptr_t run{nullptr};

namespace andamio::cli {
  namespace po = boost::program_options;
  using Opts = po::options_description;

  using RunResult = void;
  struct ArgsMap {
    std::map<std::type_index, std::shared_ptr<void>> _;
    template <typename Cmd>
    typename Cmd::Args &of() {
      return *reinterpret_cast<typename Cmd::Args *>(
          _.at(typeid(typename Cmd::Args)).get());
    }
  };
  // note: Args is defined inside command
  using Argv = std::vector<std::string>;

  inline bool isDash(const std::string &s) {
    return s.size() > 1 && s[0] == '-';
  }

  /**
   * Options are parsed only before the first positional argument, so an
   * option found among positional arguments is an error.
   */
  inline void cliPositional(const Argv &argv) {
    for (const auto &arg : argv) {
      if (isDash(arg)) {
        throw CliError{"option \"{}\" must precede positional arguments",
                       arg};
      }
    }
  }

  inline const std::string &cliArgv(const Argv &argv,
                                    const std::string_view &name) {
    cliPositional(argv);
    if (argv.size() != 1) {
      throw CliError{"expected one positional argument {}, got {}",
                     name,
                     argv.size()};
    }
    return argv[0];
  }

  inline void cliNoArgv(const Argv &argv) {
    if (!argv.empty()) {
      throw CliError{"unexpected positional argument \"{}\"", argv[0]};
    }
  }

  struct Empty {
    struct Args {
      CLI_OPTS() {
        return {};
      }
    };
    CLI_NO_RUN();
    constexpr static std::string_view kDescription{};
  };

  struct ShowHelp {};
}  // namespace andamio::cli
