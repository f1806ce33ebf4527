#pragma once

#include <cstdint>
#include <vector>

#include <boost/serialization/vector.hpp>

#include <deedchain/protocol/transaction.hpp>

namespace deedchain::protocol {

struct block
{
  std::uint64_t height = 0;
  std::vector< transaction > transactions;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & height;
    ar & transactions;
  }

  bool validate() const noexcept;
};

struct block_receipt
{
  std::uint64_t height = 0;
  std::vector< transaction_receipt > transaction_receipts;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & height;
    ar & transaction_receipts;
  }
};

} // namespace deedchain::protocol
