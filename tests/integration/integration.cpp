// NOLINTBEGIN

#include <gtest/gtest.h>

#include <charity/controller.hpp>
#include <charity/currency.hpp>
#include <charity/log.hpp>
#include <charity/pot.hpp>
#include <charity/protocol.hpp>
#include <test/fixture.hpp>

#include <variant>

using charity::currency::currency_errc;
using charity::pot::pot_errc;
using charity::protocol::protocol_errc;

class integration: public ::testing::Test,
                   public test::fixture
{
public:
  integration():
      test::fixture( "integration", "debug" ),
      root( charity::protocol::privileged_origin{} ),
      pot( _controller->pot_account() )
  {}

  integration( const integration& ) = delete;
  integration( integration&& )      = delete;

  ~integration() override = default;

  integration& operator=( const integration& ) = delete;
  integration& operator=( integration&& )      = delete;

  charity::protocol::origin root;
  charity::protocol::account pot;
};

TEST_F( integration, genesis )
{
  EXPECT_TRUE( pot == charity::pot::account_id() );
  EXPECT_TRUE( pot.program() );
  EXPECT_EQ( _controller->pot_balance(), 1 );
  EXPECT_EQ( _controller->free_balance( alice ), 100 );
  EXPECT_EQ( _controller->free_balance( bob ), 50 );
  EXPECT_EQ( _controller->free_balance( carol ), 10 );
  EXPECT_EQ( _controller->total_issuance(), 161 );
  EXPECT_TRUE( _controller->events().empty() );
  EXPECT_TRUE( verify_conservation() );
}

TEST_F( integration, donate_and_allocate )
{
  ASSERT_FALSE( _controller->apply( make_donate_call( make_signed_origin( alice ), 30 ) ) );
  EXPECT_EQ( _controller->free_balance( alice ), 70 );
  EXPECT_EQ( _controller->pot_balance(), 31 );

  ASSERT_FALSE( _controller->apply( make_allocate_call( root, carol, 20 ) ) );
  EXPECT_EQ( _controller->free_balance( carol ), 30 );
  EXPECT_EQ( _controller->pot_balance(), 11 );
  EXPECT_EQ( _controller->total_issuance(), 161 );
  EXPECT_TRUE( verify_conservation() );

  const auto& events = _controller->events();
  ASSERT_EQ( events.size(), 2 );

  EXPECT_EQ( events[ 0 ].sequence, 0 );
  EXPECT_TRUE( events[ 0 ].source == pot );
  ASSERT_TRUE( std::holds_alternative< charity::protocol::donation_received >( events[ 0 ].data ) );
  EXPECT_TRUE( std::get< charity::protocol::donation_received >( events[ 0 ].data )
               == ( charity::protocol::donation_received{ alice, 30, 31 } ) );
  ASSERT_EQ( events[ 0 ].impacted.size(), 2 );
  EXPECT_TRUE( events[ 0 ].impacted[ 0 ] == alice );
  EXPECT_TRUE( events[ 0 ].impacted[ 1 ] == pot );

  EXPECT_EQ( events[ 1 ].sequence, 1 );
  ASSERT_TRUE( std::holds_alternative< charity::protocol::funds_allocated >( events[ 1 ].data ) );
  EXPECT_TRUE( std::get< charity::protocol::funds_allocated >( events[ 1 ].data )
               == ( charity::protocol::funds_allocated{ carol, 20, 11 } ) );
}

TEST_F( integration, donation_may_drain_donor )
{
  ASSERT_FALSE( _controller->apply( make_donate_call( make_signed_origin( carol ), 10 ) ) );
  EXPECT_EQ( _controller->free_balance( carol ), 0 );
  EXPECT_EQ( _controller->pot_balance(), 11 );
  EXPECT_TRUE( verify_conservation() );
}

TEST_F( integration, bad_origins )
{
  EXPECT_EQ( _controller->apply( make_donate_call( root, 5 ) ), protocol_errc::bad_origin );
  EXPECT_EQ( _controller->apply( make_donate_call( charity::protocol::system_origin{}, 5 ) ),
             protocol_errc::bad_origin );
  EXPECT_EQ( _controller->apply( make_donate_call( make_signed_origin( pot ), 1 ) ), protocol_errc::bad_origin );

  ASSERT_FALSE( _controller->apply( make_donate_call( make_signed_origin( alice ), 30 ) ) );

  EXPECT_EQ( _controller->apply( make_allocate_call( make_signed_origin( alice ), alice, 5 ) ),
             protocol_errc::bad_origin );
  EXPECT_EQ( _controller->apply( make_allocate_call( charity::protocol::system_origin{}, alice, 5 ) ),
             protocol_errc::bad_origin );

  EXPECT_EQ( _controller->free_balance( alice ), 70 );
  EXPECT_EQ( _controller->pot_balance(), 31 );
  EXPECT_EQ( _controller->events().size(), 1 );
  EXPECT_TRUE( verify_conservation() );
}

TEST_F( integration, insufficient_funds )
{
  EXPECT_EQ( _controller->apply( make_donate_call( make_signed_origin( alice ), 101 ) ),
             pot_errc::insufficient_funds );
  EXPECT_EQ( _controller->apply( make_allocate_call( root, bob, 2 ) ), pot_errc::insufficient_pot_funds );

  ASSERT_FALSE( _controller->apply( make_donate_call( make_signed_origin( bob ), 9 ) ) );
  EXPECT_EQ( _controller->pot_balance(), 10 );

  EXPECT_EQ( _controller->apply( make_allocate_call( root, bob, 11 ) ), pot_errc::insufficient_pot_funds );
  EXPECT_EQ( _controller->pot_balance(), 10 );
  EXPECT_EQ( _controller->free_balance( bob ), 41 );

  EXPECT_EQ( _controller->events().size(), 1 );
  EXPECT_TRUE( verify_conservation() );
}

TEST_F( integration, whole_pot_can_be_allocated )
{
  ASSERT_FALSE( _controller->apply( make_donate_call( make_signed_origin( bob ), 9 ) ) );

  ASSERT_FALSE( _controller->apply( make_allocate_call( root, bob, 10 ) ) );
  EXPECT_EQ( _controller->pot_balance(), 0 );
  EXPECT_EQ( _controller->free_balance( bob ), 51 );
  EXPECT_TRUE( std::get< charity::protocol::funds_allocated >( _controller->events().back().data )
               == ( charity::protocol::funds_allocated{ bob, 10, 0 } ) );

  // A reaped pot is recreated by the next donation
  ASSERT_FALSE( _controller->apply( make_donate_call( make_signed_origin( alice ), 4 ) ) );
  EXPECT_EQ( _controller->pot_balance(), 4 );
  EXPECT_TRUE( verify_conservation() );
}

TEST_F( integration, slash_is_absorbed )
{
  ASSERT_FALSE( _controller->apply( make_slash_call( bob, 20 ) ) );
  EXPECT_EQ( _controller->free_balance( bob ), 30 );
  EXPECT_EQ( _controller->pot_balance(), 21 );
  EXPECT_EQ( _controller->total_issuance(), 161 );

  ASSERT_FALSE( _controller->apply( make_slash_call( carol, 50 ) ) );
  EXPECT_EQ( _controller->free_balance( carol ), 0 );
  EXPECT_EQ( _controller->pot_balance(), 31 );

  const auto& events = _controller->events();
  ASSERT_EQ( events.size(), 2 );
  EXPECT_TRUE( std::get< charity::protocol::imbalance_absorbed >( events[ 0 ].data )
               == ( charity::protocol::imbalance_absorbed{ 20, 21 } ) );
  EXPECT_TRUE( std::get< charity::protocol::imbalance_absorbed >( events[ 1 ].data )
               == ( charity::protocol::imbalance_absorbed{ 10, 31 } ) );
  ASSERT_EQ( events[ 1 ].impacted.size(), 1 );
  EXPECT_TRUE( events[ 1 ].impacted[ 0 ] == pot );

  // Nothing left to slash
  ASSERT_FALSE( _controller->apply( make_slash_call( carol, 5 ) ) );
  EXPECT_EQ( _controller->events().size(), 2 );
  EXPECT_TRUE( verify_conservation() );
}

TEST_F( integration, fees_are_absorbed )
{
  ASSERT_FALSE( _controller->apply( make_charge_fee_call( alice, 5 ) ) );
  EXPECT_EQ( _controller->free_balance( alice ), 95 );
  EXPECT_EQ( _controller->pot_balance(), 6 );

  EXPECT_EQ( _controller->apply( make_charge_fee_call( carol, 11 ) ), currency_errc::insufficient_balance );
  EXPECT_EQ( _controller->apply( make_charge_fee_call( carol, 10 ) ), currency_errc::keep_alive );
  EXPECT_EQ( _controller->free_balance( carol ), 10 );

  ASSERT_FALSE( _controller->apply( make_charge_fee_call( carol, 0 ) ) );
  EXPECT_EQ( _controller->events().size(), 1 );
  EXPECT_TRUE( verify_conservation() );
}

TEST_F( integration, call_sequence )
{
  std::vector< charity::protocol::call > calls = {
    make_donate_call( make_signed_origin( alice ), 40 ),
    make_donate_call( make_signed_origin( bob ), 60 ),
    make_charge_fee_call( bob, 3 ),
    make_allocate_call( root, carol, 15 ),
    make_slash_call( alice, 10 ),
    make_allocate_call( make_signed_origin( carol ), carol, 15 ),
  };

  std::size_t failures = 0;
  for( const auto& call: calls )
    if( _controller->apply( call ) )
      ++failures;

  EXPECT_EQ( failures, 2 );
  EXPECT_EQ( _controller->free_balance( alice ), 50 );
  EXPECT_EQ( _controller->free_balance( bob ), 47 );
  EXPECT_EQ( _controller->free_balance( carol ), 25 );
  EXPECT_EQ( _controller->pot_balance(), 39 );
  EXPECT_EQ( _controller->total_issuance(), 161 );
  EXPECT_EQ( _controller->events().size(), 4 );

  for( std::size_t i = 0; i < _controller->events().size(); ++i )
    EXPECT_EQ( _controller->events()[ i ].sequence, i );

  EXPECT_TRUE( verify_conservation() );
}

TEST_F( integration, open_once )
{
  EXPECT_EQ( _controller->open( _genesis ), charity::controller::controller_errc::already_open );

  charity::controller::controller closed;
  EXPECT_EQ( closed.apply( make_donate_call( make_signed_origin( alice ), 1 ) ),
             charity::controller::controller_errc::not_open );
  EXPECT_EQ( closed.pot_balance(), 0 );
  EXPECT_EQ( closed.total_issuance(), 0 );
}

class existential_deposit: public ::testing::Test,
                           public test::fixture
{
public:
  existential_deposit():
      test::fixture( "existential_deposit", "debug", 5 )
  {}

  existential_deposit( const existential_deposit& ) = delete;
  existential_deposit( existential_deposit&& )      = delete;

  ~existential_deposit() override = default;

  existential_deposit& operator=( const existential_deposit& ) = delete;
  existential_deposit& operator=( existential_deposit&& )      = delete;
};

TEST_F( existential_deposit, pot_starts_at_minimum_balance )
{
  EXPECT_EQ( _controller->pot_balance(), 5 );
  EXPECT_EQ( _controller->total_issuance(), 165 );
  EXPECT_TRUE( verify_conservation() );
}

TEST_F( existential_deposit, allocation_below_minimum_fails )
{
  auto dave = make_account( "dave" );
  _accounts.push_back( dave );

  ASSERT_FALSE( _controller->apply( make_donate_call( make_signed_origin( alice ), 10 ) ) );
  EXPECT_EQ( _controller->pot_balance(), 15 );

  EXPECT_EQ( _controller->apply( make_allocate_call( charity::protocol::privileged_origin{}, dave, 3 ) ),
             currency_errc::existential_deposit );
  EXPECT_EQ( _controller->pot_balance(), 15 );

  ASSERT_FALSE( _controller->apply( make_allocate_call( charity::protocol::privileged_origin{}, dave, 10 ) ) );
  EXPECT_EQ( _controller->free_balance( dave ), 10 );
  EXPECT_EQ( _controller->pot_balance(), 5 );
  EXPECT_TRUE( verify_conservation() );
}

TEST( controller, failed_absorption_debits_nobody )
{
  charity::log::initialize();

  auto alice = test::fixture::make_account( "alice" );

  charity::config::genesis g;
  g.existential_deposit = 5;
  g.initialize_pot      = false;
  g.balances.emplace_back( alice, 20 );

  charity::controller::controller c;
  ASSERT_FALSE( c.open( g ) );
  EXPECT_EQ( c.pot_balance(), 0 );

  // Too little to create the pot
  EXPECT_EQ( c.apply( charity::protocol::slash_call{ alice, 3 } ), currency_errc::existential_deposit );
  EXPECT_EQ( c.apply( charity::protocol::charge_fee_call{ alice, 4 } ), currency_errc::existential_deposit );
  EXPECT_EQ( c.free_balance( alice ), 20 );
  EXPECT_EQ( c.total_issuance(), 20 );
  EXPECT_TRUE( c.events().empty() );

  ASSERT_FALSE( c.apply( charity::protocol::slash_call{ alice, 5 } ) );
  EXPECT_EQ( c.pot_balance(), 5 );

  // Once the pot exists any amount is absorbed
  ASSERT_FALSE( c.apply( charity::protocol::charge_fee_call{ alice, 1 } ) );
  EXPECT_EQ( c.free_balance( alice ), 14 );
  EXPECT_EQ( c.pot_balance(), 6 );
  EXPECT_EQ( c.total_issuance(), 20 );
}

TEST( controller, invalid_genesis )
{
  charity::log::initialize();

  charity::config::genesis g;
  g.existential_deposit = 10;
  g.balances.emplace_back( test::fixture::make_account( "alice" ), 5 );

  charity::controller::controller c;
  EXPECT_EQ( c.open( g ), currency_errc::existential_deposit );
  EXPECT_EQ( c.apply( charity::protocol::slash_call{ test::fixture::make_account( "alice" ), 1 } ),
             charity::controller::controller_errc::not_open );
}

// NOLINTEND
