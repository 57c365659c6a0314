#pragma once

#include "constraints/constraints.hpp"
#include "constraints/errors.hpp"
#include "constraints/operations.hpp"
#include "constraints/scheme.hpp"
#include "layout_pass.hpp"
#include "options.hpp"
#include "util/interval.hpp"
#include "util/random_constraints.hpp"
#include "util/read_constraints.hpp"
#include "util/size.hpp"
