#pragma once

#include <boost/core/demangle.hpp>

#include <string>
#include <typeinfo>

namespace multitest {

// Helper struct for using std::visit with std::variants
template< class... Ts > struct overloaded : Ts... { using Ts::operator()...; };
template< class... Ts > overloaded( Ts... ) -> overloaded< Ts... >;

template< typename T >
std::string type_name()
{
   return boost::core::demangle( typeid( T ).name() );
}

} // multitest
