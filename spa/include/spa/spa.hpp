#pragma once
#include "angles.hpp"
#include "compose.hpp"
#include "coordinates.hpp"
#include "diagnostics.hpp"
#include "errors.hpp"
#include "levels.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "ndarray.hpp"
#include "shape.hpp"
