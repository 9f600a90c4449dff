#include <charity/chronicler/chronicler.hpp>

#include <utility>

namespace charity {

void chronicler::push_event( protocol::event&& ev )
{
  ev.sequence = _seq_no++;
  _events.emplace_back( std::move( ev ) );
}

const std::vector< protocol::event >& chronicler::events() const noexcept
{
  return _events;
}

void chronicler::clear() noexcept
{
  _events.clear();
  _seq_no = 0;
}

} // namespace charity
