#pragma once

#include <tabula/core/blob.hpp>
#include <tabula/core/error.hpp>
#include <tabula/core/format.hpp>
#include <tabula/core/meta.hpp>
#include <tabula/core/object_registry.hpp>
#include <tabula/core/value.hpp>
#include <tabula/expr/expression.hpp>
#include <tabula/io/csv.hpp>
#include <tabula/io/print.hpp>
#include <tabula/table/merge.hpp>
#include <tabula/table/table.hpp>
