#include <multitest/exception.hpp>

#include <sstream>

namespace multitest { namespace detail {

std::string json_strpolate( const std::string& format_str, const nlohmann::json& j )
{
   std::string key;
   bool has_key;
   std::string result;

   auto maybe_get_key = [&]( const std::string& str, std::size_t start, std::size_t end ) -> std::size_t
   {
      // Consume at least one character
      // Return number of characters consumed
      // If key is found, set has_key, key
      has_key = false;
      std::size_t key_start = start+2;
      if( key_start >= end )
         return (end-start);
      if( str[start  ] != '$' )
         return 1;
      if( str[start+1] != '{' )
         return 1;
      if( str[key_start] == '$' )    // Use ${$ to escape a literal ${
         return 3;
      for( std::size_t i = key_start; i < end; i++ )
      {
         if( str[i] == '}' )
         {
            has_key = true;
            key = str.substr(key_start, i-key_start);
            return (i-start)+1;
         }
      }
      return end-start;
   };

   std::size_t n = format_str.length();
   for( std::size_t i = 0; i < n; )
   {
      std::size_t consumed = maybe_get_key( format_str, i, n );
      if( has_key )
      {
         auto it = j.find(key);
         if( it != j.end() )
         {
            // Strings are substituted verbatim, everything else as its json dump
            result += it->is_string() ? it->get< std::string >() : it->dump();
            i += consumed;
            continue;
         }
      }
      for( std::size_t k = 0; k < consumed; k++ )
         result += format_str[i+k];
      i += consumed;
   }

   return result;
}

json_initializer::json_initializer( exception& e ) :
   _e(e),
   _j(*boost::get_error_info< multitest::detail::json_info >(e))
{}

json_initializer& json_initializer::operator()( const std::string& key, const char* c )
{
   _j[key] = c;
   _e.do_message_substitution();
   return *this;
}

json_initializer& json_initializer::operator()( const std::string& key, const std::string& s )
{
   _j[key] = s;
   _e.do_message_substitution();
   return *this;
}

json_initializer& json_initializer::operator()()
{
   return *this;
}

} // detail

exception::exception() { *this << multitest::detail::json_info( nlohmann::json::object() ); }

exception::exception( const std::string& m ) : exception() { msg = m; }

exception::exception( std::string&& m ) : exception() { msg = std::move( m ); }

exception::~exception() {}

const char* exception::what() const noexcept
{
   return msg.c_str();
}

std::string exception::get_stacktrace() const
{
   std::stringstream ss;
   if ( auto trace = boost::get_error_info< multitest::detail::exception_stacktrace >( *this ) )
      ss << *trace;
   return ss.str();
}

const nlohmann::json& exception::get_json() const
{
   return *boost::get_error_info< multitest::detail::json_info >( *this );
}

const std::string& exception::get_message() const
{
   return msg;
}

void exception::do_message_substitution()
{
   msg = detail::json_strpolate( msg, *boost::get_error_info< multitest::detail::json_info >( *this ) );
}

} // multitest
