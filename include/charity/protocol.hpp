#pragma once

#include <charity/protocol/account.hpp>
#include <charity/protocol/call.hpp>
#include <charity/protocol/error.hpp>
#include <charity/protocol/event.hpp>
#include <charity/protocol/origin.hpp>
