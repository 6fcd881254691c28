#pragma once

#include <multitest/contracts/deps.hpp>
#include <multitest/contracts/types.hpp>

#include <functional>

namespace multitest::contracts {

// Entry point shapes, as written by contract authors
template< typename T, typename C, typename Q >
using contract_fn = response< C >(*)( deps_mut< Q >, const env&, const message_info&, T );

template< typename T, typename C, typename Q >
using permissioned_fn = response< C >(*)( deps_mut< Q >, const env&, T );

template< typename C, typename Q >
using reply_fn = response< C >(*)( deps_mut< Q >, const env&, const reply& );

template< typename T, typename Q >
using query_fn = bytes(*)( deps< Q >, const env&, T );

// Stored shapes, able to hold an entry point directly or bridged from the baseline environment
template< typename T, typename C, typename Q >
using contract_closure = std::function< response< C >( deps_mut< Q >, const env&, const message_info&, T ) >;

template< typename T, typename C, typename Q >
using permissioned_closure = std::function< response< C >( deps_mut< Q >, const env&, T ) >;

template< typename C, typename Q >
using reply_closure = std::function< response< C >( deps_mut< Q >, const env&, const reply& ) >;

template< typename T, typename Q >
using query_closure = std::function< bytes( deps< Q >, const env&, T ) >;

} // multitest::contracts
