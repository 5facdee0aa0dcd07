#pragma once

/// \file
/// \brief Umbrella header for the public hyperpga API.

#include <hyperpga/core/algebra.hpp>
#include <hyperpga/core/config.hpp>
#include <hyperpga/core/matrix.hpp>
#include <hyperpga/core/motor.hpp>
#include <hyperpga/core/parallel.hpp>
#include <hyperpga/core/point.hpp>

#include <hyperpga/data/point_cloud.hpp>

#include <hyperpga/ops/transform.hpp>

#include <hyperpga/rig/camera_rig.hpp>
