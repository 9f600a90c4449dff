#pragma once

#include <charity/crypto/hash.hpp>
