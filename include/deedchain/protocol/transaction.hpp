#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <deedchain/protocol/account.hpp>
#include <deedchain/protocol/program.hpp>

namespace deedchain::protocol {

/**
 * A single registry call made on behalf of caller.
 */
struct transaction
{
  account caller{};
  program_input input;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & caller;
    ar & input;
  }

  bool validate() const noexcept;
};

struct transaction_receipt
{
  account caller{};
  bool reverted = false;
  program_output output;
  std::vector< std::string > logs;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & caller;
    ar & reverted;
    ar & output;
    ar & logs;
  }
};

} // namespace deedchain::protocol

template< typename T >
concept Transaction = std::same_as< deedchain::protocol::transaction, T >;
