#pragma once

#include <variant>

#include <charity/protocol/account.hpp>
#include <charity/protocol/error.hpp>

namespace charity::protocol {

struct signed_origin
{
  account signer{};
};

// Administrative authority, e.g. a decision forwarded by governance.
struct privileged_origin
{};

// Code running inside the runtime itself.
struct system_origin
{};

using origin = std::variant< signed_origin, privileged_origin, system_origin >;

/**
 * Resolve the account that signed a call.
 *
 * Fails with bad_origin unless the origin is signed by a user account.
 */
result< account > ensure_signed( const origin& o ) noexcept;

/**
 * Fails with bad_origin unless the origin is privileged.
 */
result< void > ensure_privileged( const origin& o ) noexcept;

} // namespace charity::protocol
