#pragma once
#include <multitest/exception.hpp>

namespace multitest::contracts {

MULTITEST_DECLARE_EXCEPTION( contract_exception );

// Dispatch exceptions
MULTITEST_DECLARE_DERIVED_EXCEPTION( message_format_error, contract_exception );
MULTITEST_DECLARE_DERIVED_EXCEPTION( not_implemented_error, contract_exception );
MULTITEST_DECLARE_DERIVED_EXCEPTION( contract_error, contract_exception );

// Environment exceptions
MULTITEST_DECLARE_DERIVED_EXCEPTION( parse_error, contract_exception );
MULTITEST_DECLARE_DERIVED_EXCEPTION( query_error, contract_exception );
MULTITEST_DECLARE_DERIVED_EXCEPTION( invalid_address, contract_exception );

} // multitest::contracts
