#include <multitest/contracts/testing.hpp>

#include <multitest/contracts/exceptions.hpp>
#include <multitest/contracts/json.hpp>
#include <multitest/log.hpp>

#include <algorithm>
#include <cctype>

namespace multitest::contracts {

env mock_env()
{
   env e;
   e.mutable_block()->set_height( constants::mock_block_height );
   e.mutable_block()->set_time( constants::mock_block_time );
   e.mutable_block()->set_chain_id( constants::mock_chain_id );
   e.mutable_transaction()->set_index( constants::mock_tx_index );
   e.mutable_contract()->set_address( constants::mock_contract_addr );
   return e;
}

message_info mock_info( const std::string& sender, const std::vector< coin >& funds )
{
   message_info info;
   info.set_sender( sender );
   for ( const auto& c : funds )
      *info.add_funds() = c;
   return info;
}

std::string mock_api::addr_validate( const std::string& human ) const
{
   auto normalized = addr_humanize( addr_canonicalize( human ) );
   MULTITEST_ASSERT( normalized == human, invalid_address, "address ${address} is not normalized", ("address", human) );
   return normalized;
}

bytes mock_api::addr_canonicalize( const std::string& human ) const
{
   MULTITEST_ASSERT(
      human.size() >= constants::min_address_length && human.size() <= constants::max_address_length,
      invalid_address,
      "invalid address length ${length} for ${address}",
      ("length", human.size())("address", human)
   );

   bytes canonical( human );
   std::transform( canonical.begin(), canonical.end(), canonical.begin(), []( unsigned char c ) { return std::tolower( c ); } );
   return canonical;
}

std::string mock_api::addr_humanize( const bytes& canonical ) const
{
   MULTITEST_ASSERT(
      canonical.size() >= constants::min_address_length && canonical.size() <= constants::max_address_length,
      invalid_address,
      "invalid canonical address length ${length}",
      ("length", canonical.size())
   );

   return std::string( canonical );
}

void mock_querier::set_balance( const std::string& address, const std::vector< coin >& balance )
{
   _balances[ address ] = balance;
}

void mock_querier::set_wasm_handler( wasm_handler h )
{
   _wasm_handler = std::move( h );
}

void mock_querier::set_custom_handler( custom_handler h )
{
   _custom_handler = std::move( h );
}

bytes mock_querier::raw_query( const bytes& request ) const
{
   nlohmann::json j;

   try
   {
      j = nlohmann::json::parse( request );
   }
   catch ( const nlohmann::json::exception& ex )
   {
      MULTITEST_THROW( query_error, "error parsing query request: ${error}", ("error", ex.what()) );
   }

   MULTITEST_ASSERT( j.is_object() && j.size() == 1, query_error, "query request must hold exactly one query kind" );

   try
   {
      if ( j.contains( "bank" ) )
      {
         bank_query q;
         proto_from_json( j[ "bank" ], q );
         return handle_bank( q );
      }
      else if ( j.contains( "staking" ) )
      {
         staking_query q;
         proto_from_json( j[ "staking" ], q );
         return handle_staking( q );
      }
      else if ( j.contains( "wasm" ) )
      {
         MULTITEST_ASSERT( _wasm_handler, query_error, "no wasm query handler installed" );
         wasm_query q;
         proto_from_json( j[ "wasm" ], q );
         return _wasm_handler( q );
      }
      else if ( j.contains( "custom" ) )
      {
         MULTITEST_ASSERT( _custom_handler, query_error, "no custom query handler installed" );
         return _custom_handler( j[ "custom" ] );
      }
   }
   catch ( const parse_error& ex )
   {
      MULTITEST_THROW( query_error, "error parsing query request: ${error}", ("error", ex.get_message()) );
   }

   MULTITEST_THROW( query_error, "unknown query kind in ${request}", ("request", request) );
}

bytes mock_querier::handle_bank( const bank_query& q ) const
{
   if ( q.has_balance() )
   {
      protocol::balance_response res;
      res.mutable_amount()->set_denom( q.balance().denom() );
      res.mutable_amount()->set_amount( "0" );

      if ( auto it = _balances.find( q.balance().address() ); it != _balances.end() )
      {
         for ( const auto& c : it->second )
         {
            if ( c.denom() == q.balance().denom() )
            {
               *res.mutable_amount() = c;
               break;
            }
         }
      }

      return to_json_binary( res );
   }
   else if ( q.has_all_balances() )
   {
      protocol::all_balances_response res;

      if ( auto it = _balances.find( q.all_balances().address() ); it != _balances.end() )
      {
         for ( const auto& c : it->second )
            *res.add_amount() = c;
      }

      return to_json_binary( res );
   }

   MULTITEST_THROW( query_error, "empty bank query" );
}

bytes mock_querier::handle_staking( const staking_query& q ) const
{
   if ( q.has_bonded_denom() )
      return nlohmann::json{ { "denom", constants::bonded_denom } }.dump();

   LOG(debug) << "unsupported staking query: " << q.ShortDebugString();
   MULTITEST_THROW( query_error, "staking query is not supported by the mock querier" );
}

} // multitest::contracts
