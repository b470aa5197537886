//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <utility>

#include "pgwire/logger.hpp"

namespace {

constexpr const char* logger_name = "pgwire";

std::shared_ptr<spdlog::logger> make_default_logger()
{
    // The application may have registered one with our name
    if (auto existing = spdlog::get(logger_name))
        return existing;

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    auto res = std::make_shared<spdlog::logger>(logger_name, std::move(sink));
    res->set_level(spdlog::level::info);
    res->flush_on(spdlog::level::warn);
    return res;
}

std::mutex logger_mtx;
std::shared_ptr<spdlog::logger> current_logger;

}  // namespace

std::shared_ptr<spdlog::logger> pgwire::get_logger()
{
    std::lock_guard<std::mutex> guard(logger_mtx);
    if (!current_logger)
        current_logger = make_default_logger();
    return current_logger;
}

void pgwire::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    std::lock_guard<std::mutex> guard(logger_mtx);
    current_logger = std::move(logger);
}
