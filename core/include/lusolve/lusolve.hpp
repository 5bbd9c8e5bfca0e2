#pragma once

#include "lusolve/arena.hpp"
#include "lusolve/condition.hpp"
#include "lusolve/config.hpp"
#include "lusolve/error.hpp"
#include "lusolve/explanation.hpp"
#include "lusolve/latex.hpp"
#include "lusolve/lu.hpp"
#include "lusolve/matrix.hpp"
#include "lusolve/ops.hpp"
#include "lusolve/permutation.hpp"
#include "lusolve/row_ops.hpp"
#include "lusolve/slab.hpp"
#include "lusolve/solve.hpp"
#include "lusolve/triangular.hpp"
