#pragma once

#include <deedchain/state_db/backends/backend.hpp>

#include <map>
#include <vector>

namespace deedchain::state_db::backends::map {

using map_type = std::map< std::vector< std::byte >, std::vector< std::byte > >;

class map_backend final: public abstract_backend
{
public:
  map_backend() = default;
  map_backend( std::uint64_t revision );
  map_backend( const map_backend& )            = delete;
  map_backend( map_backend&& )                 = delete;
  map_backend& operator=( const map_backend& ) = delete;
  map_backend& operator=( map_backend&& )      = delete;
  ~map_backend() final                         = default;

  std::int64_t put( std::vector< std::byte >&& key, std::span< const std::byte > value ) final;
  std::int64_t put( std::vector< std::byte >&& key, std::vector< std::byte >&& value ) final;
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const final;

  void drain( const object_visitor& visitor ) final;

  std::uint64_t size() const noexcept final;

private:
  map_type _map;
};

} // namespace deedchain::state_db::backends::map
