// filename: meritsim.hpp
// part of Hourly Merit-Order Dispatch Simulator
// MIT License

#pragma once

#include "dispatch.hpp"
#include "ingest.hpp"
#include "io_csv.hpp"
#include "market.hpp"
#include "merit_order.hpp"
#include "renewables.hpp"
#include "simulation.hpp"
#include "types.hpp"
#include "validation.hpp"
