#include <charity/protocol/event.hpp>

#include <utility>

namespace charity::protocol {

std::string_view event_name( const event_data& data ) noexcept
{
  switch( data.index() )
  {
    case 0:
      return "donation_received";
    case 1:
      return "imbalance_absorbed";
    case 2:
      return "funds_allocated";
  }
  std::unreachable();
}

} // namespace charity::protocol
