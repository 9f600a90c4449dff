#pragma once

#include <charity/config.hpp>
#include <charity/controller.hpp>
#include <charity/protocol.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level, std::uint64_t existential_deposit = 1 );
  ~fixture();

  static charity::protocol::account make_account( std::string_view seed );
  static charity::protocol::origin make_signed_origin( const charity::protocol::account& signer );

  charity::protocol::call make_donate_call( const charity::protocol::origin& caller, std::uint64_t amount ) const;
  charity::protocol::call make_allocate_call( const charity::protocol::origin& caller,
                                              const charity::protocol::account& dest,
                                              std::uint64_t amount ) const;
  charity::protocol::call make_slash_call( const charity::protocol::account& target, std::uint64_t amount ) const;
  charity::protocol::call make_charge_fee_call( const charity::protocol::account& payer,
                                                std::uint64_t amount ) const;

  // Total issuance equals the sum of every balance the fixture knows about
  bool verify_conservation() const;

  std::unique_ptr< charity::controller::controller > _controller;
  charity::config::genesis _genesis;
  std::vector< charity::protocol::account > _accounts;

  charity::protocol::account alice;
  charity::protocol::account bob;
  charity::protocol::account carol;
};

} // namespace test
