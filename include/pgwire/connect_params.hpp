//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_CONNECT_PARAMS_HPP
#define PGWIRE_CONNECT_PARAMS_HPP

#include <string>
#include <utility>
#include <vector>

namespace pgwire {

struct connect_params
{
    // TODO: UNIX sockets
    std::string hostname{"localhost"};
    unsigned short port{5432};
    std::string username{"postgres"};
    std::string password{};
    std::string database{"postgres"};

    // Additional run-time parameters sent in the startup message, like application_name
    std::vector<std::pair<std::string, std::string>> extra_params{};
};

// Reads PGHOST, PGPORT, PGUSER, PGPASSWORD, PGDATABASE and PGAPPNAME.
// Unset variables take the defaults above. Throws error_with_diagnostics
// (client_errc::invalid_connect_params) if PGPORT is not a valid port
connect_params connect_params_from_env();

}  // namespace pgwire

#endif
