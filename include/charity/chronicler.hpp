#pragma once

#include <charity/chronicler/chronicler.hpp>
