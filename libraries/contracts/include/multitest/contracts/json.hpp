#pragma once

#include <multitest/contracts/exceptions.hpp>
#include <multitest/contracts/types.hpp>

#include <google/protobuf/message.h>

#include <nlohmann/json.hpp>

#include <exception>
#include <type_traits>

namespace multitest::contracts {

nlohmann::json proto_to_json( const google::protobuf::Message& msg );
void proto_from_json( const nlohmann::json& j, google::protobuf::Message& msg );

bytes proto_to_json_binary( const google::protobuf::Message& msg );
void proto_from_json_binary( const bytes& b, google::protobuf::Message& msg );

/**
 * Decodes a json byte envelope into T.
 *
 * Types derived from google::protobuf::Message use the protobuf json mapping, everything
 * else goes through nlohmann::json and the type's from_json. Any failure, including a
 * std::exception thrown by from_json, is reported as parse_error.
 */
template< typename T >
T from_json_binary( const bytes& b )
{
   if constexpr ( std::is_base_of_v< google::protobuf::Message, T > )
   {
      T t;
      proto_from_json_binary( b, t );
      return t;
   }
   else
   {
      try
      {
         return nlohmann::json::parse( b ).get< T >();
      }
      catch ( const nlohmann::json::exception& ex )
      {
         MULTITEST_THROW( parse_error, "${error}", ("error", ex.what()) );
      }
      catch ( const std::exception& ex )
      {
         // Rejections raised by the type's own from_json
         MULTITEST_THROW( parse_error, "${error}", ("error", ex.what()) );
      }
   }
}

template< typename T >
bytes to_json_binary( const T& t )
{
   if constexpr ( std::is_base_of_v< google::protobuf::Message, T > )
   {
      return proto_to_json_binary( t );
   }
   else
   {
      return nlohmann::json( t ).dump();
   }
}

} // multitest::contracts

namespace multitest::protocol {

// Lets user message types embed protocol records (coins, events) as json fields.
template< typename T, typename = std::enable_if_t< std::is_base_of_v< google::protobuf::Message, T > > >
void to_json( nlohmann::json& j, const T& t )
{
   j = contracts::proto_to_json( t );
}

template< typename T, typename = std::enable_if_t< std::is_base_of_v< google::protobuf::Message, T > > >
void from_json( const nlohmann::json& j, T& t )
{
   contracts::proto_from_json( j, t );
}

} // multitest::protocol
