#pragma once

#include <cstdint>
#include <string_view>

#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include <deedchain/log/formatter.hpp>

namespace deedchain::log {

// Receipts are reported through the log, so the queue blocks rather than drops.
struct frontend_options
{
  static constexpr quill::QueueType queue_type                    = quill::QueueType::UnboundedBlocking;
  static constexpr std::size_t initial_queue_capacity             = 128 * 1'024;
  static constexpr std::uint32_t blocking_queue_retry_interval_ns = 800;
  static constexpr std::size_t unbounded_queue_max_capacity       = 64ull * 1'024u * 1'024u;
  static constexpr quill::HugePagesPolicy huge_pages_policy       = quill::HugePagesPolicy::Never;
};

using frontend = quill::FrontendImpl< frontend_options >;
using logger   = quill::LoggerImpl< frontend_options >;

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Set the filtering level of the root logger ("trace_l1", "debug", "info", "warning", ...).
 *
 * Returns false if the level is not recognized, leaving the current level in place.
 */
bool set_level( std::string_view level ) noexcept;

/**
 * Block until every message logged so far has been written.
 */
void flush() noexcept;

} // namespace deedchain::log
