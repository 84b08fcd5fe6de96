#pragma once

#include "linsolve/arena.hpp"
#include "linsolve/config.hpp"
#include "linsolve/error.hpp"
#include "linsolve/explanation.hpp"
#include "linsolve/latex.hpp"
#include "linsolve/matrix.hpp"
#include "linsolve/numeric.hpp"
#include "linsolve/ops.hpp"
#include "linsolve/pivot.hpp"
#include "linsolve/row_ops.hpp"
#include "linsolve/slab.hpp"
