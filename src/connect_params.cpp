//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

#include "pgwire/client_errc.hpp"
#include "pgwire/connect_params.hpp"
#include "pgwire/diagnostics.hpp"

using namespace pgwire;

namespace {

const char* get_env(const char* name)
{
    const char* res = std::getenv(name);
    return res && *res ? res : nullptr;
}

}  // namespace

connect_params pgwire::connect_params_from_env()
{
    connect_params res;

    if (const char* v = get_env("PGHOST"))
        res.hostname = v;
    if (const char* v = get_env("PGPORT"))
    {
        std::string_view port(v);
        unsigned short value{};
        auto parse_res = std::from_chars(port.data(), port.data() + port.size(), value);
        if (parse_res.ec != std::errc() || parse_res.ptr != port.data() + port.size() || value == 0u)
        {
            throw_error(client_errc::invalid_connect_params, "PGPORT is not a valid port number: " + std::string(port));
        }
        res.port = value;
    }
    if (const char* v = get_env("PGUSER"))
        res.username = v;
    if (const char* v = get_env("PGPASSWORD"))
        res.password = v;
    if (const char* v = get_env("PGDATABASE"))
        res.database = v;
    if (const char* v = get_env("PGAPPNAME"))
        res.extra_params.emplace_back("application_name", v);

    return res;
}
