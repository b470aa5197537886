//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_LOGGER_HPP
#define PGWIRE_LOGGER_HPP

#include <spdlog/logger.h>

#include <memory>

namespace pgwire {

// The logger used by the library. Named "pgwire", writing to stderr, unless replaced
std::shared_ptr<spdlog::logger> get_logger();

// Replaces the library logger. Passing nullptr restores the default one. Thread-safe
void set_logger(std::shared_ptr<spdlog::logger> logger);

}  // namespace pgwire

#define PGWIRE_LOG_DEBUG(fmt, ...) ::pgwire::get_logger()->debug(fmt, ##__VA_ARGS__)
#define PGWIRE_LOG_INFO(fmt, ...)  ::pgwire::get_logger()->info(fmt, ##__VA_ARGS__)
#define PGWIRE_LOG_WARN(fmt, ...)  ::pgwire::get_logger()->warn(fmt, ##__VA_ARGS__)
#define PGWIRE_LOG_ERROR(fmt, ...) ::pgwire::get_logger()->error(fmt, ##__VA_ARGS__)

#endif
