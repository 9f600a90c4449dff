#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace charity::protocol {

constexpr std::size_t account_key_length = 32;

using account_key = std::array< std::byte, account_key_length >;

enum class account_type : std::uint8_t
{
  user    = 0x00,
  program = 0x01,
  invalid = 0xff
};

/**
 * An address in the ledger. The first byte tags how the address was made,
 * the remaining bytes are the key.
 *
 * User accounts carry a public key and are controlled by whoever holds the
 * matching secret key. Program accounts carry a digest of an identifier.
 * No secret key corresponds to them, so they can receive funds but can never
 * authorize spending on their own.
 */
struct account: std::array< std::byte, account_key_length + 1 >
{
  bool user() const noexcept;
  bool program() const noexcept;
  account_type type() const noexcept;
};

account user_account( const account_key& key ) noexcept;

/**
 * Derive the keyless account for an identifier.
 *
 * The derivation is a pure function of the identifier: the same identifier
 * yields the same account in every process.
 */
account program_account( std::span< const std::byte > identifier ) noexcept;

} // namespace charity::protocol
