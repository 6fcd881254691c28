#include <multitest/contracts/contract_wrapper.hpp>

#include <multitest/log.hpp>

namespace multitest::contracts::detail {

void not_implemented( const char* entry_point )
{
   LOG(debug) << entry_point << " dispatched to a contract without a " << entry_point << " entry point";
   MULTITEST_THROW( not_implemented_error, "${entry_point} is not implemented for contract", ("entry_point", entry_point) );
}

} // multitest::contracts::detail
