#pragma once

#include <multitest/contracts/api.hpp>
#include <multitest/contracts/constants.hpp>
#include <multitest/contracts/deps.hpp>
#include <multitest/contracts/querier.hpp>
#include <multitest/contracts/storage.hpp>
#include <multitest/contracts/types.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace multitest::contracts {

env mock_env();
message_info mock_info( const std::string& sender = constants::mock_sender, const std::vector< coin >& funds = {} );

/**
 * Address handling for tests.
 *
 * An address is valid when its length is within bounds and it is all lower case. The
 * canonical form is the address bytes themselves.
 */
class mock_api : public abstract_api
{
   public:
      std::string addr_validate( const std::string& human ) const override;
      bytes addr_canonicalize( const std::string& human ) const override;
      std::string addr_humanize( const bytes& canonical ) const override;
};

/**
 * Answers bank queries from an in memory balance table and hands wasm and custom queries
 * to user supplied handlers. Unanswerable queries throw query_error.
 */
class mock_querier : public abstract_querier
{
   public:
      using wasm_handler   = std::function< bytes( const wasm_query& ) >;
      using custom_handler = std::function< bytes( const nlohmann::json& ) >;

      bytes raw_query( const bytes& request ) const override;

      void set_balance( const std::string& address, const std::vector< coin >& balance );
      void set_wasm_handler( wasm_handler h );
      void set_custom_handler( custom_handler h );

   private:
      bytes handle_bank( const bank_query& q ) const;
      bytes handle_staking( const staking_query& q ) const;

      std::map< std::string, std::vector< coin > > _balances;
      wasm_handler                                 _wasm_handler;
      custom_handler                               _custom_handler;
};

/**
 * Owns one of each environment handle and lends them out as execution contexts.
 */
struct mock_dependencies
{
   memory_storage storage;
   mock_api       api;
   mock_querier   querier;

   template< typename Q = empty >
   deps_mut< Q > as_mut()
   {
      return deps_mut< Q >{ storage, api, querier_wrapper< Q >( querier ) };
   }

   template< typename Q = empty >
   deps< Q > as_ref() const
   {
      return deps< Q >{ storage, api, querier_wrapper< Q >( querier ) };
   }
};

} // multitest::contracts
