#include <multitest/contracts/storage.hpp>

namespace multitest::contracts {

std::optional< bytes > memory_storage::get( const bytes& key ) const
{
   auto it = _data.find( key );
   if ( it == _data.end() )
      return {};

   return it->second;
}

void memory_storage::set( const bytes& key, const bytes& value )
{
   _data[ key ] = value;
}

void memory_storage::remove( const bytes& key )
{
   _data.erase( key );
}

std::size_t memory_storage::size() const
{
   return _data.size();
}

} // multitest::contracts
