//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_SRC_COROUTINE_HPP
#define PGWIRE_SRC_COROUTINE_HPP

// Stackless coroutine helpers for the FSMs. Use within a switch (resume_point_) statement.
// Resume point IDs must be unique within a function and greater than zero

#define PGWIRE_CORO_INITIAL case 0:

#define PGWIRE_YIELD(resume_point_var, resume_point_id, ...) \
    {                                                        \
        resume_point_var = resume_point_id;                  \
        return __VA_ARGS__;                                  \
    }                                                        \
    case resume_point_id:

#endif
