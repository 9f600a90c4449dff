#pragma once

#include <charity/pot/error.hpp>
#include <charity/pot/pot.hpp>
