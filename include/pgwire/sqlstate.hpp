//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_SQLSTATE_HPP
#define PGWIRE_SQLSTATE_HPP

#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace pgwire {

const boost::system::error_category& get_sqlstate_category();
const boost::system::error_category& get_sqlstate_class_category();

namespace detail {

// Same packing as the server's MAKE_SQLSTATE: 6 bits per character, first character
// in the lowest bits. The class (first two characters) is thus value & 0xfff
constexpr int sqlstate_sixbit(char c) { return (c - '0') & 0x3f; }

constexpr int make_sqlstate(char c1, char c2, char c3, char c4, char c5)
{
    return sqlstate_sixbit(c1) + (sqlstate_sixbit(c2) << 6) + (sqlstate_sixbit(c3) << 12) +
           (sqlstate_sixbit(c4) << 18) + (sqlstate_sixbit(c5) << 24);
}

constexpr int make_sqlstate_class(char c1, char c2) { return make_sqlstate(c1, c2, '0', '0', '0'); }

constexpr int sqlstate_class_mask = 0xfff;

}  // namespace detail

// Error codes reported by the server. Codes not listed here are still representable:
// any valid SQLSTATE maps to an error_code in the sqlstate category
enum class sqlstate : int
{
    successful_completion = detail::make_sqlstate('0', '0', '0', '0', '0'),

    // Class 01 - Warning
    warning = detail::make_sqlstate('0', '1', '0', '0', '0'),

    // Class 02 - No Data
    no_data = detail::make_sqlstate('0', '2', '0', '0', '0'),

    // Class 03 - SQL Statement Not Yet Complete
    sql_statement_not_yet_complete = detail::make_sqlstate('0', '3', '0', '0', '0'),

    // Class 08 - Connection Exception
    connection_exception = detail::make_sqlstate('0', '8', '0', '0', '0'),
    connection_does_not_exist = detail::make_sqlstate('0', '8', '0', '0', '3'),
    connection_failure = detail::make_sqlstate('0', '8', '0', '0', '6'),
    sqlclient_unable_to_establish_sqlconnection = detail::make_sqlstate('0', '8', '0', '0', '1'),
    sqlserver_rejected_establishment_of_sqlconnection = detail::make_sqlstate('0', '8', '0', '0', '4'),
    transaction_resolution_unknown = detail::make_sqlstate('0', '8', '0', '0', '7'),
    protocol_violation = detail::make_sqlstate('0', '8', 'P', '0', '1'),

    // Class 0A - Feature Not Supported
    feature_not_supported = detail::make_sqlstate('0', 'A', '0', '0', '0'),

    // Class 21 - Cardinality Violation
    cardinality_violation = detail::make_sqlstate('2', '1', '0', '0', '0'),

    // Class 22 - Data Exception
    data_exception = detail::make_sqlstate('2', '2', '0', '0', '0'),
    string_data_right_truncation = detail::make_sqlstate('2', '2', '0', '0', '1'),
    numeric_value_out_of_range = detail::make_sqlstate('2', '2', '0', '0', '3'),
    null_value_not_allowed = detail::make_sqlstate('2', '2', '0', '0', '4'),
    invalid_datetime_format = detail::make_sqlstate('2', '2', '0', '0', '7'),
    datetime_field_overflow = detail::make_sqlstate('2', '2', '0', '0', '8'),
    division_by_zero = detail::make_sqlstate('2', '2', '0', '1', '2'),
    character_not_in_repertoire = detail::make_sqlstate('2', '2', '0', '2', '1'),
    invalid_parameter_value = detail::make_sqlstate('2', '2', '0', '2', '3'),
    invalid_escape_sequence = detail::make_sqlstate('2', '2', '0', '2', '5'),
    array_subscript_error = detail::make_sqlstate('2', '2', '0', '2', 'E'),
    invalid_text_representation = detail::make_sqlstate('2', '2', 'P', '0', '2'),
    invalid_binary_representation = detail::make_sqlstate('2', '2', 'P', '0', '3'),
    bad_copy_file_format = detail::make_sqlstate('2', '2', 'P', '0', '4'),
    untranslatable_character = detail::make_sqlstate('2', '2', 'P', '0', '5'),

    // Class 23 - Integrity Constraint Violation
    integrity_constraint_violation = detail::make_sqlstate('2', '3', '0', '0', '0'),
    restrict_violation = detail::make_sqlstate('2', '3', '0', '0', '1'),
    not_null_violation = detail::make_sqlstate('2', '3', '5', '0', '2'),
    foreign_key_violation = detail::make_sqlstate('2', '3', '5', '0', '3'),
    unique_violation = detail::make_sqlstate('2', '3', '5', '0', '5'),
    check_violation = detail::make_sqlstate('2', '3', '5', '1', '4'),
    exclusion_violation = detail::make_sqlstate('2', '3', 'P', '0', '1'),

    // Class 24 - Invalid Cursor State
    invalid_cursor_state = detail::make_sqlstate('2', '4', '0', '0', '0'),

    // Class 25 - Invalid Transaction State
    invalid_transaction_state = detail::make_sqlstate('2', '5', '0', '0', '0'),
    active_sql_transaction = detail::make_sqlstate('2', '5', '0', '0', '1'),
    read_only_sql_transaction = detail::make_sqlstate('2', '5', '0', '0', '6'),
    in_failed_sql_transaction = detail::make_sqlstate('2', '5', 'P', '0', '2'),

    // Class 26 - Invalid SQL Statement Name
    invalid_sql_statement_name = detail::make_sqlstate('2', '6', '0', '0', '0'),

    // Class 28 - Invalid Authorization Specification
    invalid_authorization_specification = detail::make_sqlstate('2', '8', '0', '0', '0'),
    invalid_password = detail::make_sqlstate('2', '8', 'P', '0', '1'),

    // Class 2D - Invalid Transaction Termination
    invalid_transaction_termination = detail::make_sqlstate('2', 'D', '0', '0', '0'),

    // Class 34 - Invalid Cursor Name
    invalid_cursor_name = detail::make_sqlstate('3', '4', '0', '0', '0'),

    // Class 3D - Invalid Catalog Name
    invalid_catalog_name = detail::make_sqlstate('3', 'D', '0', '0', '0'),

    // Class 3F - Invalid Schema Name
    invalid_schema_name = detail::make_sqlstate('3', 'F', '0', '0', '0'),

    // Class 40 - Transaction Rollback
    transaction_rollback = detail::make_sqlstate('4', '0', '0', '0', '0'),
    serialization_failure = detail::make_sqlstate('4', '0', '0', '0', '1'),
    statement_completion_unknown = detail::make_sqlstate('4', '0', '0', '0', '3'),
    deadlock_detected = detail::make_sqlstate('4', '0', 'P', '0', '1'),

    // Class 42 - Syntax Error or Access Rule Violation
    syntax_error_or_access_rule_violation = detail::make_sqlstate('4', '2', '0', '0', '0'),
    syntax_error = detail::make_sqlstate('4', '2', '6', '0', '1'),
    insufficient_privilege = detail::make_sqlstate('4', '2', '5', '0', '1'),
    invalid_name = detail::make_sqlstate('4', '2', '6', '0', '2'),
    duplicate_column = detail::make_sqlstate('4', '2', '7', '0', '1'),
    ambiguous_column = detail::make_sqlstate('4', '2', '7', '0', '2'),
    undefined_column = detail::make_sqlstate('4', '2', '7', '0', '3'),
    undefined_object = detail::make_sqlstate('4', '2', '7', '0', '4'),
    duplicate_object = detail::make_sqlstate('4', '2', '7', '1', '0'),
    grouping_error = detail::make_sqlstate('4', '2', '8', '0', '3'),
    datatype_mismatch = detail::make_sqlstate('4', '2', '8', '0', '4'),
    wrong_object_type = detail::make_sqlstate('4', '2', '8', '0', '9'),
    undefined_function = detail::make_sqlstate('4', '2', '8', '8', '3'),
    undefined_table = detail::make_sqlstate('4', '2', 'P', '0', '1'),
    undefined_parameter = detail::make_sqlstate('4', '2', 'P', '0', '2'),
    duplicate_prepared_statement = detail::make_sqlstate('4', '2', 'P', '0', '5'),
    duplicate_table = detail::make_sqlstate('4', '2', 'P', '0', '7'),
    invalid_column_reference = detail::make_sqlstate('4', '2', 'P', '1', '0'),
    indeterminate_datatype = detail::make_sqlstate('4', '2', 'P', '1', '8'),

    // Class 44 - WITH CHECK OPTION Violation
    with_check_option_violation = detail::make_sqlstate('4', '4', '0', '0', '0'),

    // Class 53 - Insufficient Resources
    insufficient_resources = detail::make_sqlstate('5', '3', '0', '0', '0'),
    disk_full = detail::make_sqlstate('5', '3', '1', '0', '0'),
    out_of_memory = detail::make_sqlstate('5', '3', '2', '0', '0'),
    too_many_connections = detail::make_sqlstate('5', '3', '3', '0', '0'),

    // Class 54 - Program Limit Exceeded
    program_limit_exceeded = detail::make_sqlstate('5', '4', '0', '0', '0'),

    // Class 55 - Object Not In Prerequisite State
    object_not_in_prerequisite_state = detail::make_sqlstate('5', '5', '0', '0', '0'),
    lock_not_available = detail::make_sqlstate('5', '5', 'P', '0', '3'),

    // Class 57 - Operator Intervention
    operator_intervention = detail::make_sqlstate('5', '7', '0', '0', '0'),
    query_canceled = detail::make_sqlstate('5', '7', '0', '1', '4'),
    admin_shutdown = detail::make_sqlstate('5', '7', 'P', '0', '1'),
    crash_shutdown = detail::make_sqlstate('5', '7', 'P', '0', '2'),
    cannot_connect_now = detail::make_sqlstate('5', '7', 'P', '0', '3'),

    // Class 58 - System Error
    system_error = detail::make_sqlstate('5', '8', '0', '0', '0'),
    io_error = detail::make_sqlstate('5', '8', '0', '3', '0'),

    // Class P0 - PL/pgSQL Error
    plpgsql_error = detail::make_sqlstate('P', '0', '0', '0', '0'),
    raise_exception = detail::make_sqlstate('P', '0', '0', '0', '1'),

    // Class XX - Internal Error
    internal_error = detail::make_sqlstate('X', 'X', '0', '0', '0'),
    data_corrupted = detail::make_sqlstate('X', 'X', '0', '0', '1'),
    index_corrupted = detail::make_sqlstate('X', 'X', '0', '0', '2'),
};

// SQLSTATE classes. Every sqlstate error code is equivalent to the condition of its class,
// so code == sqlstate_class::integrity_constraint_violation holds for a unique_violation
enum class sqlstate_class : int
{
    warning = detail::make_sqlstate_class('0', '1'),
    no_data = detail::make_sqlstate_class('0', '2'),
    sql_statement_not_yet_complete = detail::make_sqlstate_class('0', '3'),
    connection_exception = detail::make_sqlstate_class('0', '8'),
    triggered_action_exception = detail::make_sqlstate_class('0', '9'),
    feature_not_supported = detail::make_sqlstate_class('0', 'A'),
    invalid_transaction_initiation = detail::make_sqlstate_class('0', 'B'),
    locator_exception = detail::make_sqlstate_class('0', 'F'),
    invalid_grantor = detail::make_sqlstate_class('0', 'L'),
    invalid_role_specification = detail::make_sqlstate_class('0', 'P'),
    diagnostics_exception = detail::make_sqlstate_class('0', 'Z'),
    case_not_found = detail::make_sqlstate_class('2', '0'),
    cardinality_violation = detail::make_sqlstate_class('2', '1'),
    data_exception = detail::make_sqlstate_class('2', '2'),
    integrity_constraint_violation = detail::make_sqlstate_class('2', '3'),
    invalid_cursor_state = detail::make_sqlstate_class('2', '4'),
    invalid_transaction_state = detail::make_sqlstate_class('2', '5'),
    invalid_sql_statement_name = detail::make_sqlstate_class('2', '6'),
    triggered_data_change_violation = detail::make_sqlstate_class('2', '7'),
    invalid_authorization_specification = detail::make_sqlstate_class('2', '8'),
    dependent_privilege_descriptors_still_exist = detail::make_sqlstate_class('2', 'B'),
    invalid_transaction_termination = detail::make_sqlstate_class('2', 'D'),
    sql_routine_exception = detail::make_sqlstate_class('2', 'F'),
    invalid_cursor_name = detail::make_sqlstate_class('3', '4'),
    external_routine_exception = detail::make_sqlstate_class('3', '8'),
    external_routine_invocation_exception = detail::make_sqlstate_class('3', '9'),
    savepoint_exception = detail::make_sqlstate_class('3', 'B'),
    invalid_catalog_name = detail::make_sqlstate_class('3', 'D'),
    invalid_schema_name = detail::make_sqlstate_class('3', 'F'),
    transaction_rollback = detail::make_sqlstate_class('4', '0'),
    syntax_error_or_access_rule_violation = detail::make_sqlstate_class('4', '2'),
    with_check_option_violation = detail::make_sqlstate_class('4', '4'),
    insufficient_resources = detail::make_sqlstate_class('5', '3'),
    program_limit_exceeded = detail::make_sqlstate_class('5', '4'),
    object_not_in_prerequisite_state = detail::make_sqlstate_class('5', '5'),
    operator_intervention = detail::make_sqlstate_class('5', '7'),
    system_error = detail::make_sqlstate_class('5', '8'),
    snapshot_too_old = detail::make_sqlstate_class('7', '2'),
    config_file_error = detail::make_sqlstate_class('F', '0'),
    fdw_error = detail::make_sqlstate_class('H', 'V'),
    plpgsql_error = detail::make_sqlstate_class('P', '0'),
    internal_error = detail::make_sqlstate_class('X', 'X'),
};

inline boost::system::error_code make_error_code(sqlstate v)
{
    return boost::system::error_code(static_cast<int>(v), get_sqlstate_category());
}

inline boost::system::error_condition make_error_condition(sqlstate_class v)
{
    return boost::system::error_condition(static_cast<int>(v), get_sqlstate_class_category());
}

// Parses a 5 character SQLSTATE (digits and upper case letters). Returns an empty optional
// if the input is not a valid SQLSTATE
std::optional<sqlstate> parse_sqlstate(std::string_view code);

// The 5 character representation of a code, e.g. "23505"
std::string to_string(sqlstate code);

// Builds the error code for a server error given its SQLSTATE field. ErrorResponses without
// a valid SQLSTATE get client_errc::exec_server_error
boost::system::error_code make_server_error_code(std::optional<std::string_view> sqlstate_field);

// If ec belongs to the sqlstate category, returns its 5 character code. Otherwise, an empty string
std::string sqlstate_of(const boost::system::error_code& ec);

}  // namespace pgwire

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::pgwire::sqlstate>
{
    static constexpr bool value = true;
};

template <>
struct is_error_condition_enum<::pgwire::sqlstate_class>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

#endif
