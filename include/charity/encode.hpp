#pragma once

#include <charity/encode/error.hpp>
#include <charity/encode/hex.hpp>
