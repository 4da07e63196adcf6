#pragma once

/// Umbrella header for the waycodec list-parameter codec.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "number_format.hpp"
#include "criteria.hpp"
#include "list_parser.hpp"
#include "list_formatter.hpp"
#include "route_parameters.hpp"
