#pragma once

#include <charity/memory/memory.hpp>
