#pragma once

#include <multitest/contracts/types.hpp>

#include <map>
#include <optional>

namespace multitest::contracts {

/**
 * Key value store backing a contract's persistent state.
 */
class abstract_storage
{
   public:
      virtual ~abstract_storage() = default;

      virtual std::optional< bytes > get( const bytes& key ) const = 0;
      virtual void set( const bytes& key, const bytes& value ) = 0;
      virtual void remove( const bytes& key ) = 0;
};

class memory_storage : public abstract_storage
{
   public:
      std::optional< bytes > get( const bytes& key ) const override;
      void set( const bytes& key, const bytes& value ) override;
      void remove( const bytes& key ) override;

      std::size_t size() const;

   private:
      std::map< bytes, bytes > _data;
};

} // multitest::contracts
