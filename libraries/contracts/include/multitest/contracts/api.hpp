#pragma once

#include <multitest/contracts/types.hpp>

#include <string>

namespace multitest::contracts {

/**
 * Address handling provided by the host.
 *
 * Implementations throw invalid_address for input they cannot accept.
 */
class abstract_api
{
   public:
      virtual ~abstract_api() = default;

      /// Returns the normalized form of a human readable address
      virtual std::string addr_validate( const std::string& human ) const = 0;
      virtual bytes addr_canonicalize( const std::string& human ) const = 0;
      virtual std::string addr_humanize( const bytes& canonical ) const = 0;
};

} // multitest::contracts
