#pragma once

#include <multitest/contracts/exceptions.hpp>
#include <multitest/contracts/json.hpp>
#include <multitest/contracts/types.hpp>
#include <multitest/util.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <variant>
#include <vector>

namespace multitest::contracts {

using protocol::bank_query;
using protocol::staking_query;
using protocol::wasm_query;

/**
 * Read only access to the host's query router.
 *
 * The request is a json encoded query_request. Implementations return the json encoded
 * result or throw query_error when the host rejects the query.
 */
class abstract_querier
{
   public:
      virtual ~abstract_querier() = default;

      virtual bytes raw_query( const bytes& request ) const = 0;
};

/// A chain-specific query carried inside a query_request.
template< typename Q >
struct custom_query
{
   Q value;
};

template< typename Q = empty >
using query_request = std::variant<
   bank_query,
   staking_query,
   wasm_query,
   custom_query< Q >
>;

/**
 * Encodes a request as a single keyed json object: {"bank":...}, {"staking":...},
 * {"wasm":...} or {"custom":...}.
 */
template< typename Q >
bytes encode_query_request( const query_request< Q >& request )
{
   nlohmann::json j;

   std::visit( overloaded {
      [&]( const bank_query& q )        { j[ "bank" ]    = proto_to_json( q ); },
      [&]( const staking_query& q )     { j[ "staking" ] = proto_to_json( q ); },
      [&]( const wasm_query& q )        { j[ "wasm" ]    = proto_to_json( q ); },
      [&]( const custom_query< Q >& q ) { j[ "custom" ]  = q.value; }
   }, request );

   return j.dump();
}

/**
 * Typed front end over an abstract_querier for a caller whose custom query type is Q.
 *
 * Holds a non-owning pointer to the querier, which only offers const access. Re-wrapping
 * the same querier with a different Q is how a context drops or changes its query extension.
 */
template< typename Q = empty >
class querier_wrapper
{
   public:
      explicit querier_wrapper( const abstract_querier& q ) : _querier( &q ) {}

      const abstract_querier& inner() const
      {
         return *_querier;
      }

      bytes query_raw( const query_request< Q >& request ) const
      {
         return _querier->raw_query( encode_query_request< Q >( request ) );
      }

      template< typename T >
      T query( const query_request< Q >& request ) const
      {
         return from_json_binary< T >( query_raw( request ) );
      }

      coin query_balance( const std::string& address, const std::string& denom ) const
      {
         bank_query q;
         q.mutable_balance()->set_address( address );
         q.mutable_balance()->set_denom( denom );
         return query< protocol::balance_response >( q ).amount();
      }

      std::vector< coin > query_all_balances( const std::string& address ) const
      {
         bank_query q;
         q.mutable_all_balances()->set_address( address );
         auto res = query< protocol::all_balances_response >( q );
         return std::vector< coin >( res.amount().begin(), res.amount().end() );
      }

      template< typename T, typename M >
      T query_wasm_smart( const std::string& contract_addr, const M& msg ) const
      {
         wasm_query q;
         q.mutable_smart()->set_contract_addr( contract_addr );
         q.mutable_smart()->set_msg( to_json_binary( msg ) );
         return query< T >( q );
      }

      bytes query_wasm_raw( const std::string& contract_addr, const bytes& key ) const
      {
         wasm_query q;
         q.mutable_raw()->set_contract_addr( contract_addr );
         q.mutable_raw()->set_key( key );
         return query_raw( q );
      }

   private:
      const abstract_querier* _querier;
};

} // multitest::contracts
