#pragma once

#include <multitest/contracts/api.hpp>
#include <multitest/contracts/querier.hpp>
#include <multitest/contracts/storage.hpp>
#include <multitest/contracts/types.hpp>

namespace multitest::contracts {

/**
 * Shared read only execution context, handed to query entry points.
 *
 * The handles are borrowed from the caller for the duration of one call.
 */
template< typename Q = empty >
struct deps
{
   const abstract_storage& storage;
   const abstract_api&     api;
   querier_wrapper< Q >    querier;
};

/**
 * Exclusive mutable execution context, handed to state changing entry points.
 */
template< typename Q = empty >
struct deps_mut
{
   abstract_storage&       storage;
   const abstract_api&     api;
   querier_wrapper< Q >    querier;

   deps< Q > as_ref() const
   {
      return deps< Q >{ storage, api, querier };
   }

   deps_mut branch()
   {
      return deps_mut{ storage, api, querier };
   }
};

} // multitest::contracts
