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

#ifndef SHMESH_GRID_GEOMETRY_H
#define SHMESH_GRID_GEOMETRY_H

#include "../Core/ShMeshComm.h"
#include "../Core/ShMeshTypes.h"

#include <span>

namespace shmesh {

/**
 * @brief Uniform R x R x R grid over the global particle bounding box
 *
 * Cell (i,j,k) covers [min + (i,j,k)*cell_size, min + (i+1,j+1,k+1)*cell_size)
 * and linearizes to i + R*j + R^2*k. Coordinates outside the box are clipped
 * to the boundary cells, so every point maps to a valid cell.
 */
class GridGeometry {
public:
  GridGeometry() = default;

  /**
   * @brief Grid over an explicit box
   * @throws InvalidArgumentException if resolution is outside [1, MAX_GRID_RESOLUTION]
   */
  GridGeometry(const BoundingBox& bounds, int resolution);

  /**
   * @brief Grid over the global extent of distributed positions
   *
   * Collective: one MIN and one MAX reduction of the per-rank extents. Ranks
   * without particles contribute neutral values. With no particles at all
   * the box collapses to the origin.
   *
   * @param positions_local this rank's positions, row-major N x 3
   */
  static GridGeometry build(const ShMeshComm& comm,
                            std::span<const real_t> positions_local,
                            int resolution);

  int resolution() const noexcept { return resolution_; }
  int n_cells() const noexcept { return resolution_ * resolution_ * resolution_; }
  const BoundingBox& bounds() const noexcept { return bounds_; }
  const Vec3& cell_size() const noexcept { return cell_size_; }

  int linear_index(int i, int j, int k) const noexcept {
    return i + resolution_ * j + resolution_ * resolution_ * k;
  }

  int linear_index(const CellCoord& c) const noexcept {
    return linear_index(c[0], c[1], c[2]);
  }

  CellCoord cell_coord_of(const Vec3& point) const noexcept;

  int cell_index_of(const Vec3& point) const noexcept {
    return linear_index(cell_coord_of(point));
  }

  /**
   * @brief Clipped inclusive range of cells overlapping [box_min, box_max]
   *
   * Empty when box_min > box_max on some axis.
   */
  CellRange cell_range(const Vec3& box_min, const Vec3& box_max) const noexcept;

private:
  int axis_coord(real_t x, int axis) const noexcept;

  BoundingBox bounds_;
  Vec3 cell_size_ { {0.0, 0.0, 0.0} };
  int resolution_ = 1;
};

} // namespace shmesh

#endif // SHMESH_GRID_GEOMETRY_H
