#pragma once

#include <deedchain/state_db/types.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace deedchain::state_db::backends {

using object_visitor = std::function< void( std::vector< std::byte >&& key, std::vector< std::byte >&& value ) >;

class abstract_backend
{
public:
  abstract_backend() = default;
  abstract_backend( std::uint64_t revision );
  abstract_backend( const abstract_backend& )            = default;
  abstract_backend( abstract_backend&& )                 = delete;
  abstract_backend& operator=( const abstract_backend& ) = default;
  abstract_backend& operator=( abstract_backend&& )      = delete;
  virtual ~abstract_backend()                            = default;

  virtual std::int64_t put( std::vector< std::byte >&& key, std::span< const std::byte > value )         = 0;
  virtual std::int64_t put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )           = 0;
  virtual std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const = 0;

  /**
   * Extract every object in key order, handing ownership of each to visitor.
   * The backend is empty afterwards.
   */
  virtual void drain( const object_visitor& visitor ) = 0;

  virtual std::uint64_t size() const = 0;
  bool empty() const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t );

private:
  std::uint64_t _revision = 0;
};

} // namespace deedchain::state_db::backends
