/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include "GridGeometry.h"
#include "../Core/ShMeshConfig.h"
#include "../Core/ShMeshException.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace shmesh {

GridGeometry::GridGeometry(const BoundingBox& bounds, int resolution)
    : bounds_(bounds), resolution_(resolution) {
  SHMESH_CHECK_ARG(resolution >= 1 && resolution <= config::MAX_GRID_RESOLUTION,
                   "Grid resolution must be in [1, " +
                   std::to_string(config::MAX_GRID_RESOLUTION) + "], got " +
                   std::to_string(resolution));
  for (int d = 0; d < 3; ++d) {
    SHMESH_CHECK_ARG(bounds_.min[d] <= bounds_.max[d],
                     "Bounding box min exceeds max on axis " + std::to_string(d));
    cell_size_[d] = (bounds_.max[d] - bounds_.min[d]) / resolution_;
  }
}

GridGeometry GridGeometry::build(const ShMeshComm& comm,
                                 std::span<const real_t> positions_local,
                                 int resolution) {
  SHMESH_CHECK_ARG(positions_local.size() % 3 == 0,
                   "Position array length " + std::to_string(positions_local.size()) +
                   " is not a multiple of 3");

  constexpr real_t inf = std::numeric_limits<real_t>::infinity();
  Vec3 local_min = {inf, inf, inf};
  Vec3 local_max = {-inf, -inf, -inf};

  const size_t n = positions_local.size() / 3;
  for (size_t p = 0; p < n; ++p) {
    for (int d = 0; d < 3; ++d) {
      const real_t x = positions_local[3 * p + static_cast<size_t>(d)];
      local_min[d] = std::min(local_min[d], x);
      local_max[d] = std::max(local_max[d], x);
    }
  }

  BoundingBox box;
  box.min = comm.allreduce_min(local_min);
  box.max = comm.allreduce_max(local_max);

  // No particles anywhere: collapse to the origin
  for (int d = 0; d < 3; ++d) {
    if (box.min[d] > box.max[d]) {
      box.min[d] = 0.0;
      box.max[d] = 0.0;
    }
  }

  return GridGeometry(box, resolution);
}

int GridGeometry::axis_coord(real_t x, int axis) const noexcept {
  // Zero cell size gives +-inf or NaN; both are clipped below
  const real_t raw = std::floor((x - bounds_.min[axis]) / cell_size_[axis]);
  if (std::isnan(raw) || raw < 0.0) {
    return 0;
  }
  if (raw > static_cast<real_t>(resolution_ - 1)) {
    return resolution_ - 1;
  }
  return static_cast<int>(raw);
}

CellCoord GridGeometry::cell_coord_of(const Vec3& point) const noexcept {
  return {axis_coord(point[0], 0), axis_coord(point[1], 1), axis_coord(point[2], 2)};
}

CellRange GridGeometry::cell_range(const Vec3& box_min, const Vec3& box_max) const noexcept {
  CellRange range;
  for (int d = 0; d < 3; ++d) {
    if (box_min[d] > box_max[d] || std::isnan(box_min[d]) || std::isnan(box_max[d])) {
      return CellRange{};
    }
    range.lo[d] = axis_coord(box_min[d], d);
    range.hi[d] = axis_coord(box_max[d], d);
  }
  return range;
}

} // namespace shmesh
