// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <sstream>
#include <string>

#include <quarry/infra/common/log.hpp>

namespace quarry::test_util {

//! RAII change of the log verbosity, restoring the previous one so that tests can run in any order
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level new_level) : previous_level_(log::get_verbosity()) {
        log::set_verbosity(new_level);
    }
    ~SetLogVerbosityGuard() { log::set_verbosity(previous_level_); }

  private:
    log::Level previous_level_;
};

//! RAII redirection of the console log output into a string, with the given logging settings and no colors
//! \remarks Restores std::cout, std::cerr and silences logging on destruction
class LogCapture {
  public:
    explicit LogCapture(log::Settings settings = {})
        : cout_buffer_{std::cout.rdbuf(captured_.rdbuf())}, cerr_buffer_{std::cerr.rdbuf(captured_.rdbuf())} {
        settings.log_nocolor = true;
        log::init(settings);
    }
    ~LogCapture() {
        std::cout.rdbuf(cout_buffer_);
        std::cerr.rdbuf(cerr_buffer_);
        log::init(log::Settings{.log_verbosity = log::Level::kNone});
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string output() const { return captured_.str(); }

  private:
    std::stringstream captured_;
    std::streambuf* cout_buffer_;
    std::streambuf* cerr_buffer_;
};

}  // namespace quarry::test_util
