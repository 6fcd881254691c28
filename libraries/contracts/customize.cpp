#include <multitest/contracts/customize.hpp>

#include <multitest/log.hpp>

#include <boost/stacktrace.hpp>

#include <cstdlib>

namespace multitest::contracts::detail {

void unreachable_message( const std::string& what )
{
   LOG(fatal) << "unreachable: " << what;
   LOG(fatal) << boost::stacktrace::to_string( boost::stacktrace::stacktrace() );
   boost::log::core::get()->flush();
   std::abort();
}

} // multitest::contracts::detail
