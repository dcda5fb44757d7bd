#pragma once

/// Convenience umbrella header for the nadeef cleaning core.

#include <nadeef/core/cell.hpp>
#include <nadeef/core/column.hpp>
#include <nadeef/core/diagnostics.hpp>
#include <nadeef/core/error.hpp>
#include <nadeef/core/row.hpp>
#include <nadeef/core/schema.hpp>
#include <nadeef/core/value.hpp>
#include <nadeef/pipeline/executor.hpp>
#include <nadeef/query/predicate.hpp>
#include <nadeef/query/query_spec.hpp>
#include <nadeef/rule/rule.hpp>
#include <nadeef/store/metadata.hpp>
#include <nadeef/store/sqlite.hpp>
#include <nadeef/table/memory_table.hpp>
#include <nadeef/table/print.hpp>
#include <nadeef/table/relational_table.hpp>
