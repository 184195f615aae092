#pragma once

/// Convenience umbrella header for the tbl library.

#include <tbl/core/column.hpp>
#include <tbl/core/error.hpp>
#include <tbl/core/range.hpp>
#include <tbl/core/registry.hpp>
#include <tbl/expr/predicate.hpp>
#include <tbl/io/reader.hpp>
#include <tbl/table/table.hpp>
