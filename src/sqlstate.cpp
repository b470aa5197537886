//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

#include "pgwire/client_errc.hpp"
#include "pgwire/sqlstate.hpp"

using namespace pgwire;

namespace {

struct sqlstate_name
{
    sqlstate code;
    const char* name;
};

struct sqlstate_class_name
{
    sqlstate_class code;
    const char* name;
};

// Codes with a name. Other codes are valid, but are reported by their 5 characters only
constexpr sqlstate_name sqlstate_names[] = {
    {sqlstate::successful_completion, "successful_completion"},
    {sqlstate::warning, "warning"},
    {sqlstate::no_data, "no_data"},
    {sqlstate::sql_statement_not_yet_complete, "sql_statement_not_yet_complete"},
    {sqlstate::connection_exception, "connection_exception"},
    {sqlstate::connection_does_not_exist, "connection_does_not_exist"},
    {sqlstate::connection_failure, "connection_failure"},
    {sqlstate::sqlclient_unable_to_establish_sqlconnection, "sqlclient_unable_to_establish_sqlconnection"},
    {sqlstate::sqlserver_rejected_establishment_of_sqlconnection, "sqlserver_rejected_establishment_of_sqlconnection"},
    {sqlstate::transaction_resolution_unknown, "transaction_resolution_unknown"},
    {sqlstate::protocol_violation, "protocol_violation"},
    {sqlstate::feature_not_supported, "feature_not_supported"},
    {sqlstate::cardinality_violation, "cardinality_violation"},
    {sqlstate::data_exception, "data_exception"},
    {sqlstate::string_data_right_truncation, "string_data_right_truncation"},
    {sqlstate::numeric_value_out_of_range, "numeric_value_out_of_range"},
    {sqlstate::null_value_not_allowed, "null_value_not_allowed"},
    {sqlstate::invalid_datetime_format, "invalid_datetime_format"},
    {sqlstate::datetime_field_overflow, "datetime_field_overflow"},
    {sqlstate::division_by_zero, "division_by_zero"},
    {sqlstate::character_not_in_repertoire, "character_not_in_repertoire"},
    {sqlstate::invalid_parameter_value, "invalid_parameter_value"},
    {sqlstate::invalid_escape_sequence, "invalid_escape_sequence"},
    {sqlstate::array_subscript_error, "array_subscript_error"},
    {sqlstate::invalid_text_representation, "invalid_text_representation"},
    {sqlstate::invalid_binary_representation, "invalid_binary_representation"},
    {sqlstate::bad_copy_file_format, "bad_copy_file_format"},
    {sqlstate::untranslatable_character, "untranslatable_character"},
    {sqlstate::integrity_constraint_violation, "integrity_constraint_violation"},
    {sqlstate::restrict_violation, "restrict_violation"},
    {sqlstate::not_null_violation, "not_null_violation"},
    {sqlstate::foreign_key_violation, "foreign_key_violation"},
    {sqlstate::unique_violation, "unique_violation"},
    {sqlstate::check_violation, "check_violation"},
    {sqlstate::exclusion_violation, "exclusion_violation"},
    {sqlstate::invalid_cursor_state, "invalid_cursor_state"},
    {sqlstate::invalid_transaction_state, "invalid_transaction_state"},
    {sqlstate::active_sql_transaction, "active_sql_transaction"},
    {sqlstate::read_only_sql_transaction, "read_only_sql_transaction"},
    {sqlstate::in_failed_sql_transaction, "in_failed_sql_transaction"},
    {sqlstate::invalid_sql_statement_name, "invalid_sql_statement_name"},
    {sqlstate::invalid_authorization_specification, "invalid_authorization_specification"},
    {sqlstate::invalid_password, "invalid_password"},
    {sqlstate::invalid_transaction_termination, "invalid_transaction_termination"},
    {sqlstate::invalid_cursor_name, "invalid_cursor_name"},
    {sqlstate::invalid_catalog_name, "invalid_catalog_name"},
    {sqlstate::invalid_schema_name, "invalid_schema_name"},
    {sqlstate::transaction_rollback, "transaction_rollback"},
    {sqlstate::serialization_failure, "serialization_failure"},
    {sqlstate::statement_completion_unknown, "statement_completion_unknown"},
    {sqlstate::deadlock_detected, "deadlock_detected"},
    {sqlstate::syntax_error_or_access_rule_violation, "syntax_error_or_access_rule_violation"},
    {sqlstate::syntax_error, "syntax_error"},
    {sqlstate::insufficient_privilege, "insufficient_privilege"},
    {sqlstate::invalid_name, "invalid_name"},
    {sqlstate::duplicate_column, "duplicate_column"},
    {sqlstate::ambiguous_column, "ambiguous_column"},
    {sqlstate::undefined_column, "undefined_column"},
    {sqlstate::undefined_object, "undefined_object"},
    {sqlstate::duplicate_object, "duplicate_object"},
    {sqlstate::grouping_error, "grouping_error"},
    {sqlstate::datatype_mismatch, "datatype_mismatch"},
    {sqlstate::wrong_object_type, "wrong_object_type"},
    {sqlstate::undefined_function, "undefined_function"},
    {sqlstate::undefined_table, "undefined_table"},
    {sqlstate::undefined_parameter, "undefined_parameter"},
    {sqlstate::duplicate_prepared_statement, "duplicate_prepared_statement"},
    {sqlstate::duplicate_table, "duplicate_table"},
    {sqlstate::invalid_column_reference, "invalid_column_reference"},
    {sqlstate::indeterminate_datatype, "indeterminate_datatype"},
    {sqlstate::with_check_option_violation, "with_check_option_violation"},
    {sqlstate::insufficient_resources, "insufficient_resources"},
    {sqlstate::disk_full, "disk_full"},
    {sqlstate::out_of_memory, "out_of_memory"},
    {sqlstate::too_many_connections, "too_many_connections"},
    {sqlstate::program_limit_exceeded, "program_limit_exceeded"},
    {sqlstate::object_not_in_prerequisite_state, "object_not_in_prerequisite_state"},
    {sqlstate::lock_not_available, "lock_not_available"},
    {sqlstate::operator_intervention, "operator_intervention"},
    {sqlstate::query_canceled, "query_canceled"},
    {sqlstate::admin_shutdown, "admin_shutdown"},
    {sqlstate::crash_shutdown, "crash_shutdown"},
    {sqlstate::cannot_connect_now, "cannot_connect_now"},
    {sqlstate::system_error, "system_error"},
    {sqlstate::io_error, "io_error"},
    {sqlstate::plpgsql_error, "plpgsql_error"},
    {sqlstate::raise_exception, "raise_exception"},
    {sqlstate::internal_error, "internal_error"},
    {sqlstate::data_corrupted, "data_corrupted"},
    {sqlstate::index_corrupted, "index_corrupted"},
};

constexpr sqlstate_class_name sqlstate_class_names[] = {
    {sqlstate_class::warning, "warning"},
    {sqlstate_class::no_data, "no_data"},
    {sqlstate_class::sql_statement_not_yet_complete, "sql_statement_not_yet_complete"},
    {sqlstate_class::connection_exception, "connection_exception"},
    {sqlstate_class::triggered_action_exception, "triggered_action_exception"},
    {sqlstate_class::feature_not_supported, "feature_not_supported"},
    {sqlstate_class::invalid_transaction_initiation, "invalid_transaction_initiation"},
    {sqlstate_class::locator_exception, "locator_exception"},
    {sqlstate_class::invalid_grantor, "invalid_grantor"},
    {sqlstate_class::invalid_role_specification, "invalid_role_specification"},
    {sqlstate_class::diagnostics_exception, "diagnostics_exception"},
    {sqlstate_class::case_not_found, "case_not_found"},
    {sqlstate_class::cardinality_violation, "cardinality_violation"},
    {sqlstate_class::data_exception, "data_exception"},
    {sqlstate_class::integrity_constraint_violation, "integrity_constraint_violation"},
    {sqlstate_class::invalid_cursor_state, "invalid_cursor_state"},
    {sqlstate_class::invalid_transaction_state, "invalid_transaction_state"},
    {sqlstate_class::invalid_sql_statement_name, "invalid_sql_statement_name"},
    {sqlstate_class::triggered_data_change_violation, "triggered_data_change_violation"},
    {sqlstate_class::invalid_authorization_specification, "invalid_authorization_specification"},
    {sqlstate_class::dependent_privilege_descriptors_still_exist, "dependent_privilege_descriptors_still_exist"},
    {sqlstate_class::invalid_transaction_termination, "invalid_transaction_termination"},
    {sqlstate_class::sql_routine_exception, "sql_routine_exception"},
    {sqlstate_class::invalid_cursor_name, "invalid_cursor_name"},
    {sqlstate_class::external_routine_exception, "external_routine_exception"},
    {sqlstate_class::external_routine_invocation_exception, "external_routine_invocation_exception"},
    {sqlstate_class::savepoint_exception, "savepoint_exception"},
    {sqlstate_class::invalid_catalog_name, "invalid_catalog_name"},
    {sqlstate_class::invalid_schema_name, "invalid_schema_name"},
    {sqlstate_class::transaction_rollback, "transaction_rollback"},
    {sqlstate_class::syntax_error_or_access_rule_violation, "syntax_error_or_access_rule_violation"},
    {sqlstate_class::with_check_option_violation, "with_check_option_violation"},
    {sqlstate_class::insufficient_resources, "insufficient_resources"},
    {sqlstate_class::program_limit_exceeded, "program_limit_exceeded"},
    {sqlstate_class::object_not_in_prerequisite_state, "object_not_in_prerequisite_state"},
    {sqlstate_class::operator_intervention, "operator_intervention"},
    {sqlstate_class::system_error, "system_error"},
    {sqlstate_class::snapshot_too_old, "snapshot_too_old"},
    {sqlstate_class::config_file_error, "config_file_error"},
    {sqlstate_class::fdw_error, "fdw_error"},
    {sqlstate_class::plpgsql_error, "plpgsql_error"},
    {sqlstate_class::internal_error, "internal_error"},
};

const char* find_name(sqlstate code)
{
    auto it = std::find_if(std::begin(sqlstate_names), std::end(sqlstate_names), [code](const sqlstate_name& n) {
        return n.code == code;
    });
    return it == std::end(sqlstate_names) ? nullptr : it->name;
}

const char* find_name(sqlstate_class code)
{
    auto it = std::find_if(
        std::begin(sqlstate_class_names),
        std::end(sqlstate_class_names),
        [code](const sqlstate_class_name& n) { return n.code == code; }
    );
    return it == std::end(sqlstate_class_names) ? nullptr : it->name;
}

bool is_sqlstate_char(char c) { return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z'); }

char from_sixbit(int v) { return static_cast<char>('0' + (v & 0x3f)); }

// Unpacks the characters of a packed code. Only the first n characters are written
std::string unpack(int value, std::size_t n)
{
    std::string res;
    for (std::size_t i = 0; i < n; ++i)
        res.push_back(from_sixbit(value >> (6 * i)));
    return res;
}

class sqlstate_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "pgwire.sqlstate"; }

    std::string message(int ev) const final override
    {
        std::string res = unpack(ev, 5u);
        if (const char* n = find_name(static_cast<sqlstate>(ev)))
        {
            res += ": ";
            res += n;
        }
        return res;
    }

    boost::system::error_condition default_error_condition(int ev) const noexcept final override
    {
        return boost::system::error_condition(ev & detail::sqlstate_class_mask, get_sqlstate_class_category());
    }
};

class sqlstate_class_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "pgwire.sqlstate_class"; }

    std::string message(int ev) const final override
    {
        std::string res = "class ";
        res += unpack(ev, 2u);
        if (const char* n = find_name(static_cast<sqlstate_class>(ev)))
        {
            res += ": ";
            res += n;
        }
        return res;
    }
};

const sqlstate_category g_sqlstate_cat;
const sqlstate_class_category g_sqlstate_class_cat;

}  // namespace

const boost::system::error_category& pgwire::get_sqlstate_category() { return g_sqlstate_cat; }

const boost::system::error_category& pgwire::get_sqlstate_class_category() { return g_sqlstate_class_cat; }

std::optional<sqlstate> pgwire::parse_sqlstate(std::string_view code)
{
    if (code.size() != 5u || !std::all_of(code.begin(), code.end(), is_sqlstate_char))
        return {};
    return static_cast<sqlstate>(detail::make_sqlstate(code[0], code[1], code[2], code[3], code[4]));
}

std::string pgwire::to_string(sqlstate code) { return unpack(static_cast<int>(code), 5u); }

boost::system::error_code pgwire::make_server_error_code(std::optional<std::string_view> sqlstate_field)
{
    auto code = sqlstate_field ? parse_sqlstate(*sqlstate_field) : std::nullopt;

    // 00000 would produce a zero error code, which means success
    if (!code || *code == sqlstate::successful_completion)
        return client_errc::exec_server_error;
    return *code;
}

std::string pgwire::sqlstate_of(const boost::system::error_code& ec)
{
    if (ec.category() != get_sqlstate_category())
        return {};
    return to_string(static_cast<sqlstate>(ec.value()));
}
