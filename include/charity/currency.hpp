#pragma once

#include <charity/currency/balances.hpp>
#include <charity/currency/error.hpp>
#include <charity/currency/imbalance.hpp>
#include <charity/currency/ledger_interface.hpp>
