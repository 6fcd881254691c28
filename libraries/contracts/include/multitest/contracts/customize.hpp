#pragma once

#include <multitest/contracts/callbacks.hpp>
#include <multitest/contracts/deps.hpp>
#include <multitest/contracts/types.hpp>
#include <multitest/util.hpp>

#include <string>
#include <utility>
#include <variant>

/*
 * Bridging of contracts written against the baseline environment (no custom message, no
 * custom query) into callers that use chain-specific extensions.
 *
 * On the way in the context is stripped of its query extension. On the way out the
 * baseline response is lifted into response< C >.
 */

namespace multitest::contracts {

namespace detail {

/**
 * Reached only when a baseline response carries a message a baseline contract cannot
 * produce. This is a broken programming contract, not a recoverable condition: the
 * message is logged at fatal level and the process is aborted.
 */
[[noreturn]] void unreachable_message( const std::string& what );

} // detail

template< typename Q >
deps_mut< empty > decustomize_deps_mut( deps_mut< Q >& ctx )
{
   return deps_mut< empty >{ ctx.storage, ctx.api, querier_wrapper< empty >( ctx.querier.inner() ) };
}

template< typename Q >
deps< empty > decustomize_deps( const deps< Q >& ctx )
{
   return deps< empty >{ ctx.storage, ctx.api, querier_wrapper< empty >( ctx.querier.inner() ) };
}

template< typename C >
cosmos_msg< C > customize_msg( cosmos_msg< empty >&& msg )
{
   static_assert( std::variant_size_v< cosmos_msg< empty > > == 7, "every cosmos_msg alternative must be mapped" );

   if ( msg.valueless_by_exception() )
      detail::unreachable_message( "valueless cosmos message in a baseline response" );

   return std::visit( overloaded {
      []( wasm_msg&& m )           -> cosmos_msg< C > { return std::move( m ); },
      []( bank_msg&& m )           -> cosmos_msg< C > { return std::move( m ); },
      []( staking_msg&& m )        -> cosmos_msg< C > { return std::move( m ); },
      []( distribution_msg&& m )   -> cosmos_msg< C > { return std::move( m ); },
      []( ibc_msg&& m )            -> cosmos_msg< C > { return std::move( m ); },
      []( stargate_msg&& m )       -> cosmos_msg< C > { return std::move( m ); },
      []( custom_msg< empty >&& )  -> cosmos_msg< C >
      {
         detail::unreachable_message( "custom message in a baseline response" );
      }
   }, std::move( msg ) );
}

template< typename C >
sub_msg< C > customize_sub_msg( sub_msg< empty >&& msg )
{
   return sub_msg< C >{ msg.id, customize_msg< C >( std::move( msg.msg ) ), msg.gas_limit, msg.reply_on };
}

template< typename C >
response< C > customize_response( response< empty >&& resp )
{
   response< C > customized;
   customized.messages.reserve( resp.messages.size() );

   for ( auto& msg : resp.messages )
      customized.messages.emplace_back( customize_sub_msg< C >( std::move( msg ) ) );

   customized.attributes = std::move( resp.attributes );
   customized.events     = std::move( resp.events );
   customized.data       = std::move( resp.data );

   return customized;
}

template< typename T, typename C, typename Q >
contract_closure< T, C, Q > customize_contract_fn( contract_fn< T, empty, empty > raw_fn )
{
   return [raw_fn]( deps_mut< Q > ctx, const env& e, const message_info& info, T msg ) -> response< C >
   {
      return customize_response< C >( raw_fn( decustomize_deps_mut( ctx ), e, info, std::move( msg ) ) );
   };
}

template< typename T, typename Q >
query_closure< T, Q > customize_query_fn( query_fn< T, empty > raw_fn )
{
   return [raw_fn]( deps< Q > ctx, const env& e, T msg ) -> bytes
   {
      return raw_fn( decustomize_deps( ctx ), e, std::move( msg ) );
   };
}

template< typename T, typename C, typename Q >
permissioned_closure< T, C, Q > customize_permissioned_fn( permissioned_fn< T, empty, empty > raw_fn )
{
   return [raw_fn]( deps_mut< Q > ctx, const env& e, T msg ) -> response< C >
   {
      return customize_response< C >( raw_fn( decustomize_deps_mut( ctx ), e, std::move( msg ) ) );
   };
}

template< typename C, typename Q >
reply_closure< C, Q > customize_reply_fn( reply_fn< empty, empty > raw_fn )
{
   return [raw_fn]( deps_mut< Q > ctx, const env& e, const reply& r ) -> response< C >
   {
      return customize_response< C >( raw_fn( decustomize_deps_mut( ctx ), e, r ) );
   };
}

} // multitest::contracts
