#pragma once

#include <ranges>

#include <boost/endian.hpp>

#include <deedchain/controller.hpp>
#include <deedchain/memory.hpp>
#include <deedchain/program.hpp>
#include <deedchain/protocol.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level, std::uint64_t genesis_height = 0 );
  ~fixture();

  deedchain::protocol::transaction make_transaction( const deedchain::protocol::account& caller,
                                                     std::vector< std::byte >&& stdin ) const;

  template< Transaction... Args >
  deedchain::protocol::block make_block( Args... args )
  {
    return make_block( _controller->head().height + 1, std::forward< Args >( args )... );
  }

  template< Transaction... Args >
  deedchain::protocol::block make_block( std::uint64_t height, Args... args )
  {
    deedchain::protocol::block b;
    ( ( b.transactions.emplace_back( std::forward< Args >( args ) ) ), ... );
    b.height = height;
    return b;
  }

  template< std::integral T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    boost::endian::native_to_little_inplace( t );
    const auto bytes = deedchain::memory::as_bytes( std::addressof( t ), 1 );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< std::ranges::range T >
  void append_stdin( std::vector< std::byte >& input, const T& t ) const noexcept
  {
    const auto bytes = deedchain::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< typename T >
    requires std::is_enum_v< T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    return append_stdin( input, std::to_underlying( t ) );
  }

  std::vector< std::byte > make_stdin( deedchain::program::instruction i ) const noexcept
  {
    std::vector< std::byte > input;
    append_stdin( input, i );
    return input;
  }

  /**
   * Encode a call: the instruction, the payload length and the archived arguments.
   */
  template< typename T >
  std::vector< std::byte > make_stdin( deedchain::program::instruction i, const T& args ) const
  {
    auto payload = deedchain::protocol::to_binary( args );

    std::vector< std::byte > input;
    append_stdin( input, i );
    append_stdin( input, static_cast< std::uint32_t >( payload.size() ) );
    append_stdin( input, payload );
    return input;
  }

  deedchain::protocol::program_input make_input( std::vector< std::byte >&& stdin,
                                                 std::vector< std::string >&& arguments = {} ) const noexcept;

  template< typename T >
  T read_output( const deedchain::protocol::program_output& output ) const
  {
    return deedchain::protocol::from_binary< T >( output.stdout );
  }

  enum verification : std::uint_fast8_t
  {
    none              = 0,
    processed         = 1 << 0,
    head              = 1 << 1,
    without_reversion = 1 << 2
  };

  bool verify( deedchain::controller::result< deedchain::protocol::block_receipt > receipt,
               std::uint64_t flags ) const;

  std::unique_ptr< deedchain::controller::controller > _controller;
};

} // namespace test
