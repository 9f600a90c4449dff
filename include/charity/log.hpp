#pragma once

#include <charity/log/log.hpp>
