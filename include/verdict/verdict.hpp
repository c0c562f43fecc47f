#pragma once

/** \file verdict.hpp
 *  \brief Umbrella header for the verdict predicate evaluation engine.
 */

#include "verdict/error.hpp"
#include "verdict/instant.hpp"
#include "verdict/matcher.hpp"
#include "verdict/operator_table.hpp"
#include "verdict/options.hpp"
#include "verdict/path_resolver.hpp"
#include "verdict/predicate_evaluator.hpp"
#include "verdict/result.hpp"
#include "verdict/specification.hpp"
#include "verdict/specification_evaluator.hpp"
#include "verdict/value.hpp"
