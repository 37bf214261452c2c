#pragma once

/// Convenience umbrella header for the Strata library.

#include <strata/core/cast.hpp>
#include <strata/core/column.hpp>
#include <strata/core/dtype.hpp>
#include <strata/core/error.hpp>
#include <strata/core/parallel.hpp>
#include <strata/core/series.hpp>
#include <strata/core/strings.hpp>
#include <strata/engine/group.hpp>
#include <strata/engine/join.hpp>
#include <strata/engine/sort.hpp>
#include <strata/io/format.hpp>
#include <strata/table/table.hpp>
