// include/datrack/datrack.hpp
// Umbrella header.

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "people.hpp"
#include "props.hpp"
#include "tracker.hpp"
#include "transport.hpp"
#include "types.hpp"
