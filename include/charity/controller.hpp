#pragma once

#include <charity/controller/controller.hpp>
#include <charity/controller/error.hpp>
