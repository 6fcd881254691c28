#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/util/message_differencer.h>

#include <nlohmann/json.hpp>

#include <multitest/protocol/protocol.pb.h>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace multitest::protocol {

// Value equality for the generated records, found through ADL by std::variant and std::vector.
template< typename T, typename = std::enable_if_t< std::is_base_of_v< google::protobuf::Message, T > > >
bool operator==( const T& lhs, const T& rhs )
{
   return google::protobuf::util::MessageDifferencer::Equals( lhs, rhs );
}

template< typename T, typename = std::enable_if_t< std::is_base_of_v< google::protobuf::Message, T > > >
bool operator!=( const T& lhs, const T& rhs )
{
   return !( lhs == rhs );
}

} // multitest::protocol

namespace multitest::contracts {

using bytes = std::string;

using protocol::attribute;
using protocol::coin;
using protocol::env;
using protocol::event;
using protocol::message_info;
using protocol::reply;
using protocol::sub_msg_response;

using protocol::bank_msg;
using protocol::distribution_msg;
using protocol::ibc_msg;
using protocol::staking_msg;
using protocol::stargate_msg;
using protocol::wasm_msg;

/**
 * The absence of a chain-specific extension.
 *
 * Used as the custom message type of contracts that emit only the universal message
 * variants and as the custom query type of queriers that answer only universal queries.
 */
struct empty {};

inline bool operator==( const empty&, const empty& ) { return true; }
inline bool operator!=( const empty&, const empty& ) { return false; }

inline void to_json( nlohmann::json& j, const empty& )
{
   j = nlohmann::json::object();
}

inline void from_json( const nlohmann::json& j, empty& )
{
   // Throws nlohmann::json::type_error for anything but an object
   j.get_ref< const nlohmann::json::object_t& >();
}

/// A chain-specific message carried inside a cosmos_msg.
template< typename C >
struct custom_msg
{
   C value;
};

template< typename C >
bool operator==( const custom_msg< C >& lhs, const custom_msg< C >& rhs ) { return lhs.value == rhs.value; }

template< typename C >
bool operator!=( const custom_msg< C >& lhs, const custom_msg< C >& rhs ) { return !( lhs == rhs ); }

/**
 * A side effect a contract asks the host to perform.
 *
 * The first four alternatives are the universal messages, ibc_msg and stargate_msg are
 * passed through to the host untouched and custom_msg< C > is the chain extension.
 */
template< typename C = empty >
using cosmos_msg = std::variant<
   wasm_msg,
   bank_msg,
   staking_msg,
   distribution_msg,
   ibc_msg,
   stargate_msg,
   custom_msg< C >
>;

/// When the host should call back into the emitting contract's reply entry point.
enum class reply_on : uint8_t
{
   always,
   success,
   error,
   never
};

template< typename C = empty >
struct sub_msg
{
   uint64_t                   id = 0;
   cosmos_msg< C >            msg;
   std::optional< uint64_t >  gas_limit;
   contracts::reply_on        reply_on = contracts::reply_on::never;

   static sub_msg create( cosmos_msg< C > m )
   {
      return sub_msg{ 0, std::move( m ), std::nullopt, contracts::reply_on::never };
   }

   static sub_msg reply_on_success( cosmos_msg< C > m, uint64_t id )
   {
      return sub_msg{ id, std::move( m ), std::nullopt, contracts::reply_on::success };
   }

   static sub_msg reply_on_error( cosmos_msg< C > m, uint64_t id )
   {
      return sub_msg{ id, std::move( m ), std::nullopt, contracts::reply_on::error };
   }

   static sub_msg reply_always( cosmos_msg< C > m, uint64_t id )
   {
      return sub_msg{ id, std::move( m ), std::nullopt, contracts::reply_on::always };
   }

   sub_msg& with_gas_limit( uint64_t limit )
   {
      gas_limit = limit;
      return *this;
   }
};

template< typename C >
bool operator==( const sub_msg< C >& lhs, const sub_msg< C >& rhs )
{
   return lhs.id == rhs.id
       && lhs.msg == rhs.msg
       && lhs.gas_limit == rhs.gas_limit
       && lhs.reply_on == rhs.reply_on;
}

template< typename C >
bool operator!=( const sub_msg< C >& lhs, const sub_msg< C >& rhs ) { return !( lhs == rhs ); }

/**
 * The record of side effects produced by a successful state changing entry point.
 */
template< typename C = empty >
struct response
{
   std::vector< sub_msg< C > > messages;
   std::vector< attribute >    attributes;
   std::vector< event >        events;
   std::optional< bytes >      data;

   response& add_attribute( const std::string& key, const std::string& value )
   {
      attribute a;
      a.set_key( key );
      a.set_value( value );
      attributes.emplace_back( std::move( a ) );
      return *this;
   }

   template< typename Iterator >
   response& add_attributes( Iterator first, Iterator last )
   {
      attributes.insert( attributes.end(), first, last );
      return *this;
   }

   response& add_message( cosmos_msg< C > msg )
   {
      messages.emplace_back( sub_msg< C >::create( std::move( msg ) ) );
      return *this;
   }

   response& add_submessage( sub_msg< C > msg )
   {
      messages.emplace_back( std::move( msg ) );
      return *this;
   }

   template< typename Iterator >
   response& add_submessages( Iterator first, Iterator last )
   {
      messages.insert( messages.end(), first, last );
      return *this;
   }

   response& add_event( event e )
   {
      events.emplace_back( std::move( e ) );
      return *this;
   }

   template< typename Iterator >
   response& add_events( Iterator first, Iterator last )
   {
      events.insert( events.end(), first, last );
      return *this;
   }

   response& set_data( bytes d )
   {
      data = std::move( d );
      return *this;
   }
};

template< typename C >
bool operator==( const response< C >& lhs, const response< C >& rhs )
{
   return lhs.messages == rhs.messages
       && lhs.attributes == rhs.attributes
       && lhs.events == rhs.events
       && lhs.data == rhs.data;
}

template< typename C >
bool operator!=( const response< C >& lhs, const response< C >& rhs ) { return !( lhs == rhs ); }

inline event make_event( const std::string& type )
{
   event e;
   e.set_type( type );
   return e;
}

inline coin make_coin( const std::string& amount, const std::string& denom )
{
   coin c;
   c.set_denom( denom );
   c.set_amount( amount );
   return c;
}

} // multitest::contracts
