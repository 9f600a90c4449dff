#pragma once

#include <cstdint>
#include <vector>

#include <charity/protocol/event.hpp>

namespace charity {

/**
 * Append-only record of the events emitted while applying calls.
 *
 * Each event is stamped with its position in the log.
 */
class chronicler final
{
public:
  void push_event( protocol::event&& ev );
  const std::vector< protocol::event >& events() const noexcept;
  void clear() noexcept;

private:
  std::vector< protocol::event > _events;
  std::uint32_t _seq_no = 0;
};

} // namespace charity
