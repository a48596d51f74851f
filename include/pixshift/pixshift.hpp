#pragma once

#include "pixshift/image.hpp"
#include "pixshift/errors.hpp"
#include "pixshift/logger.hpp"
#include "pixshift/interpolation.hpp"
#include "pixshift/dispatch.hpp"
#include "pixshift/affine.hpp"
#include "pixshift/geometry.hpp"
#include "pixshift/color.hpp"
#include "pixshift/filters.hpp"
#include "pixshift/convert.hpp"
