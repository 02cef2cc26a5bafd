#pragma once

/// \file
/// \brief Umbrella header for the public simplicia API.

#include <simplicia/core/config.hpp>
#include <simplicia/core/error.hpp>
#include <simplicia/core/union_find.hpp>

#include <simplicia/data/complex.hpp>

#include <simplicia/ops/algebra.hpp>
#include <simplicia/ops/homology.hpp>

#include <simplicia/lang/ast.hpp>
#include <simplicia/lang/evaluator.hpp>
#include <simplicia/lang/operators.hpp>
#include <simplicia/lang/parser.hpp>
#include <simplicia/lang/state.hpp>
#include <simplicia/lang/value.hpp>

#include <simplicia/io/exporter.hpp>
#include <simplicia/io/importer.hpp>
