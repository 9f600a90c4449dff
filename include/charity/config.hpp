#pragma once

#include <charity/config/error.hpp>
#include <charity/config/genesis.hpp>
#include <charity/config/options.hpp>
