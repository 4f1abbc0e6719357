#pragma once

/// Convenience umbrella header for the recsql library.

#include <recsql/core/convert.hpp>
#include <recsql/core/format.hpp>
#include <recsql/core/seq.hpp>
#include <recsql/core/time.hpp>
#include <recsql/core/value.hpp>
#include <recsql/runtime/aggregate.hpp>
#include <recsql/runtime/aggregate_registry.hpp>
#include <recsql/runtime/group.hpp>
#include <recsql/runtime/join.hpp>
