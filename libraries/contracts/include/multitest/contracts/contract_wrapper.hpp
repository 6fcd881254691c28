#pragma once

#include <multitest/contracts/callbacks.hpp>
#include <multitest/contracts/contract.hpp>
#include <multitest/contracts/customize.hpp>
#include <multitest/contracts/exceptions.hpp>
#include <multitest/contracts/json.hpp>
#include <multitest/contracts/types.hpp>
#include <multitest/util.hpp>

#include <exception>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace multitest::contracts {

namespace detail {

template< typename T, typename = void >
struct is_streamable : std::false_type {};

template< typename T >
struct is_streamable< T, std::void_t< decltype( std::declval< std::ostream& >() << std::declval< const T& >() ) > > : std::true_type {};

template< typename E >
constexpr bool is_displayable_v = std::is_base_of_v< std::exception, E > || is_streamable< E >::value;

template< typename E >
std::string display( const E& err )
{
   if constexpr ( std::is_base_of_v< std::exception, E > )
   {
      return err.what();
   }
   else
   {
      std::ostringstream ss;
      ss << err;
      return ss.str();
   }
}

[[noreturn]] void not_implemented( const char* entry_point );

// Entry points may take their message by value or by const reference
template< typename T >
std::decay_t< T > decode_message( const bytes& msg, const char* entry_point )
{
   try
   {
      return from_json_binary< std::decay_t< T > >( msg );
   }
   catch ( const parse_error& ex )
   {
      MULTITEST_THROW(
         message_format_error,
         "error parsing ${type} for ${entry_point}: ${error}",
         ("entry_point", entry_point)("type", type_name< std::decay_t< T > >())("error", ex.get_message())
      );
   }
}

/*
 * Runs fn, translating an E thrown by the contract into the uniform error type. An E that
 * already is a multitest::exception is rethrown as is. Anything that is not an E propagates
 * untouched.
 */
template< typename E, typename Fn >
auto invoke_normalized( const char* entry_point, Fn&& fn ) -> decltype( fn() )
{
   try
   {
      return fn();
   }
   catch ( const E& err )
   {
      if constexpr ( std::is_base_of_v< multitest::exception, E > )
      {
         throw;
      }
      else
      {
         if constexpr ( std::is_polymorphic_v< E > )
         {
            if ( dynamic_cast< const multitest::exception* >( &err ) )
               throw;
         }

         MULTITEST_THROW( contract_error, "${error}", ("entry_point", entry_point)("error", display( err )) );
      }
   }
}

} // detail

/**
 * Adapts six independently typed entry points to the uniform contract interface.
 *
 * Each entry point has its own message type (T*) and error type (E*). The error type names
 * the exception the entry point throws on failure; it must derive from std::exception or be
 * streamable. sudo, reply and migrate are optional and report not_implemented_error until
 * populated with one of the with_* builders, each of which returns a new wrapper type.
 *
 * A wrapper is immutable once built and holds no other state, so a single instance serves
 * any number of calls.
 */
template<
   typename T1,                  // message passed to execute
   typename T2,                  // message passed to instantiate
   typename T3,                  // message passed to query
   typename E1 = std::exception, // error thrown from execute
   typename E2 = std::exception, // error thrown from instantiate
   typename E3 = std::exception, // error thrown from query
   typename C  = empty,          // custom message returned from every entry point but query
   typename Q  = empty,          // custom query accepted by the querier in the context
   typename T4 = empty,          // message passed to sudo
   typename E4 = std::exception, // error thrown from sudo
   typename E5 = std::exception, // error thrown from reply
   typename T6 = empty,          // message passed to migrate
   typename E6 = std::exception  // error thrown from migrate
>
class contract_wrapper : public contract< C, Q >
{
   static_assert( detail::is_displayable_v< E1 >, "execute error type must be displayable" );
   static_assert( detail::is_displayable_v< E2 >, "instantiate error type must be displayable" );
   static_assert( detail::is_displayable_v< E3 >, "query error type must be displayable" );
   static_assert( detail::is_displayable_v< E4 >, "sudo error type must be displayable" );
   static_assert( detail::is_displayable_v< E5 >, "reply error type must be displayable" );
   static_assert( detail::is_displayable_v< E6 >, "migrate error type must be displayable" );

   public:
      contract_wrapper(
         contract_closure< T1, C, Q >                        execute_fn,
         contract_closure< T2, C, Q >                        instantiate_fn,
         query_closure< T3, Q >                              query_fn,
         std::optional< permissioned_closure< T4, C, Q > >   sudo_fn    = {},
         std::optional< reply_closure< C, Q > >              reply_fn   = {},
         std::optional< permissioned_closure< T6, C, Q > >   migrate_fn = {} ) :
         _execute_fn( std::move( execute_fn ) ),
         _instantiate_fn( std::move( instantiate_fn ) ),
         _query_fn( std::move( query_fn ) ),
         _sudo_fn( std::move( sudo_fn ) ),
         _reply_fn( std::move( reply_fn ) ),
         _migrate_fn( std::move( migrate_fn ) )
      {}

      /// Populates the sudo entry point with one using this wrapper's custom message type
      template< typename E4A = std::exception, typename T4A >
      contract_wrapper< T1, T2, T3, E1, E2, E3, C, Q, T4A, E4A, E5, T6, E6 >
      with_sudo( permissioned_fn< T4A, C, Q > fn ) const
      {
         return { _execute_fn, _instantiate_fn, _query_fn, permissioned_closure< T4A, C, Q >( fn ), _reply_fn, _migrate_fn };
      }

      /// Populates the sudo entry point with one written against the baseline environment
      template< typename E4A = std::exception, typename T4A >
      contract_wrapper< T1, T2, T3, E1, E2, E3, C, Q, T4A, E4A, E5, T6, E6 >
      with_sudo_empty( permissioned_fn< T4A, empty, empty > fn ) const
      {
         return { _execute_fn, _instantiate_fn, _query_fn, customize_permissioned_fn< T4A, C, Q >( fn ), _reply_fn, _migrate_fn };
      }

      /// Populates the reply entry point with one using this wrapper's custom message type
      template< typename E5A = std::exception >
      contract_wrapper< T1, T2, T3, E1, E2, E3, C, Q, T4, E4, E5A, T6, E6 >
      with_reply( reply_fn< C, Q > fn ) const
      {
         return { _execute_fn, _instantiate_fn, _query_fn, _sudo_fn, reply_closure< C, Q >( fn ), _migrate_fn };
      }

      /// Populates the reply entry point with one written against the baseline environment
      template< typename E5A = std::exception >
      contract_wrapper< T1, T2, T3, E1, E2, E3, C, Q, T4, E4, E5A, T6, E6 >
      with_reply_empty( reply_fn< empty, empty > fn ) const
      {
         return { _execute_fn, _instantiate_fn, _query_fn, _sudo_fn, customize_reply_fn< C, Q >( fn ), _migrate_fn };
      }

      /// Populates the migrate entry point with one using this wrapper's custom message type
      template< typename E6A = std::exception, typename T6A >
      contract_wrapper< T1, T2, T3, E1, E2, E3, C, Q, T4, E4, E5, T6A, E6A >
      with_migrate( permissioned_fn< T6A, C, Q > fn ) const
      {
         return { _execute_fn, _instantiate_fn, _query_fn, _sudo_fn, _reply_fn, permissioned_closure< T6A, C, Q >( fn ) };
      }

      /// Populates the migrate entry point with one written against the baseline environment
      template< typename E6A = std::exception, typename T6A >
      contract_wrapper< T1, T2, T3, E1, E2, E3, C, Q, T4, E4, E5, T6A, E6A >
      with_migrate_empty( permissioned_fn< T6A, empty, empty > fn ) const
      {
         return { _execute_fn, _instantiate_fn, _query_fn, _sudo_fn, _reply_fn, customize_permissioned_fn< T6A, C, Q >( fn ) };
      }

      bool has_sudo() const    { return _sudo_fn.has_value(); }
      bool has_reply() const   { return _reply_fn.has_value(); }
      bool has_migrate() const { return _migrate_fn.has_value(); }

      response< C > execute( deps_mut< Q > ctx, const env& e, const message_info& info, const bytes& msg ) const override
      {
         auto m = detail::decode_message< T1 >( msg, "execute" );
         return detail::invoke_normalized< E1 >( "execute", [&]() { return _execute_fn( ctx, e, info, std::move( m ) ); } );
      }

      response< C > instantiate( deps_mut< Q > ctx, const env& e, const message_info& info, const bytes& msg ) const override
      {
         auto m = detail::decode_message< T2 >( msg, "instantiate" );
         return detail::invoke_normalized< E2 >( "instantiate", [&]() { return _instantiate_fn( ctx, e, info, std::move( m ) ); } );
      }

      bytes query( deps< Q > ctx, const env& e, const bytes& msg ) const override
      {
         auto m = detail::decode_message< T3 >( msg, "query" );
         return detail::invoke_normalized< E3 >( "query", [&]() { return _query_fn( ctx, e, std::move( m ) ); } );
      }

      response< C > sudo( deps_mut< Q > ctx, const env& e, const bytes& msg ) const override
      {
         if ( !_sudo_fn )
            detail::not_implemented( "sudo" );

         auto m = detail::decode_message< T4 >( msg, "sudo" );
         return detail::invoke_normalized< E4 >( "sudo", [&]() { return ( *_sudo_fn )( ctx, e, std::move( m ) ); } );
      }

      response< C > reply( deps_mut< Q > ctx, const env& e, const contracts::reply& r ) const override
      {
         if ( !_reply_fn )
            detail::not_implemented( "reply" );

         return detail::invoke_normalized< E5 >( "reply", [&]() { return ( *_reply_fn )( ctx, e, r ); } );
      }

      response< C > migrate( deps_mut< Q > ctx, const env& e, const bytes& msg ) const override
      {
         if ( !_migrate_fn )
            detail::not_implemented( "migrate" );

         auto m = detail::decode_message< T6 >( msg, "migrate" );
         return detail::invoke_normalized< E6 >( "migrate", [&]() { return ( *_migrate_fn )( ctx, e, std::move( m ) ); } );
      }

   private:
      contract_closure< T1, C, Q >                        _execute_fn;
      contract_closure< T2, C, Q >                        _instantiate_fn;
      query_closure< T3, Q >                              _query_fn;
      std::optional< permissioned_closure< T4, C, Q > >   _sudo_fn;
      std::optional< reply_closure< C, Q > >              _reply_fn;
      std::optional< permissioned_closure< T6, C, Q > >   _migrate_fn;
};

/**
 * Builds a wrapper from entry points written against the caller's environment. C and Q are
 * deduced from the entry points, the error types may be given explicitly.
 */
template<
   typename E1 = std::exception,
   typename E2 = E1,
   typename E3 = E1,
   typename T1,
   typename T2,
   typename T3,
   typename C,
   typename Q
>
contract_wrapper< T1, T2, T3, E1, E2, E3, C, Q >
make_contract_wrapper( contract_fn< T1, C, Q > execute, contract_fn< T2, C, Q > instantiate, query_fn< T3, Q > query )
{
   return contract_wrapper< T1, T2, T3, E1, E2, E3, C, Q >(
      contract_closure< T1, C, Q >( execute ),
      contract_closure< T2, C, Q >( instantiate ),
      query_closure< T3, Q >( query )
   );
}

/**
 * Builds a wrapper for a caller using custom message type C and custom query type Q from
 * entry points written against the baseline environment.
 *
 * The entry points see a context without the query extension and their responses are
 * lifted into response< C >.
 */
template<
   typename C = empty,
   typename Q = empty,
   typename E1 = std::exception,
   typename E2 = E1,
   typename E3 = E1,
   typename T1,
   typename T2,
   typename T3
>
contract_wrapper< T1, T2, T3, E1, E2, E3, C, Q >
make_contract_wrapper_with_empty(
   contract_fn< T1, empty, empty > execute,
   contract_fn< T2, empty, empty > instantiate,
   query_fn< T3, empty > query )
{
   return contract_wrapper< T1, T2, T3, E1, E2, E3, C, Q >(
      customize_contract_fn< T1, C, Q >( execute ),
      customize_contract_fn< T2, C, Q >( instantiate ),
      customize_query_fn< T3, Q >( query )
   );
}

/// Moves a wrapper behind the uniform interface, the form a simulation engine stores it in.
template< typename Wrapper >
std::unique_ptr< contract< typename Wrapper::custom_message_type, typename Wrapper::custom_query_type > >
box_contract( Wrapper w )
{
   return std::make_unique< Wrapper >( std::move( w ) );
}

} // multitest::contracts
