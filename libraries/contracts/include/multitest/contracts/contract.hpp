#pragma once

#include <multitest/contracts/deps.hpp>
#include <multitest/contracts/types.hpp>

namespace multitest::contracts {

/**
 * The single calling convention the simulation engine uses for every contract.
 *
 * Messages arrive json encoded. C is the chain-specific message type the contract may emit
 * and Q the chain-specific query type its querier accepts. Every entry point reports failure
 * by throwing a multitest::exception.
 */
template< typename C = empty, typename Q = empty >
class contract
{
   public:
      using custom_message_type = C;
      using custom_query_type   = Q;

      virtual ~contract() = default;

      /// Evaluates the contract's execute entry point
      virtual response< C > execute( deps_mut< Q > ctx, const env& e, const message_info& info, const bytes& msg ) const = 0;

      /// Evaluates the contract's instantiate entry point
      virtual response< C > instantiate( deps_mut< Q > ctx, const env& e, const message_info& info, const bytes& msg ) const = 0;

      /// Evaluates the contract's query entry point
      virtual bytes query( deps< Q > ctx, const env& e, const bytes& msg ) const = 0;

      /// Evaluates the contract's sudo entry point
      virtual response< C > sudo( deps_mut< Q > ctx, const env& e, const bytes& msg ) const = 0;

      /// Evaluates the contract's reply entry point
      virtual response< C > reply( deps_mut< Q > ctx, const env& e, const contracts::reply& r ) const = 0;

      /// Evaluates the contract's migrate entry point
      virtual response< C > migrate( deps_mut< Q > ctx, const env& e, const bytes& msg ) const = 0;
};

} // multitest::contracts
