#include <deedchain/state_db/backends/map/map_backend.hpp>

#include <algorithm>

namespace deedchain::state_db::backends::map {

map_backend::map_backend( std::uint64_t revision ):
    abstract_backend( revision )
{}

std::int64_t map_backend::put( std::vector< std::byte >&& key, std::span< const std::byte > value )
{
  return put( std::move( key ), std::vector< std::byte >( value.begin(), value.end() ) );
}

std::int64_t map_backend::put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )
{
  std::int64_t size = std::ssize( key ) + std::ssize( value );
  auto itr          = _map.lower_bound( key );

  if( itr != _map.end() && std::ranges::equal( key, itr->first ) )
    size -= std::ssize( itr->first ) + std::ssize( itr->second );

  _map.insert_or_assign( itr, std::move( key ), std::move( value ) );

  return size;
}

std::optional< std::span< const std::byte > > map_backend::get( const std::vector< std::byte >& key ) const
{
  if( auto itr = _map.find( key ); itr != _map.end() )
    return std::span< const std::byte >( itr->second );

  return {};
}

void map_backend::drain( const object_visitor& visitor )
{
  while( !_map.empty() )
  {
    auto node = _map.extract( _map.begin() );
    visitor( std::move( node.key() ), std::move( node.mapped() ) );
  }
}

std::uint64_t map_backend::size() const noexcept
{
  return _map.size();
}

} // namespace deedchain::state_db::backends::map
