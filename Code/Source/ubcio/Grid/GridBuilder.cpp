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

#include "GridBuilder.h"
#include "../Core/UbcException.h"
#include "../Core/UbcLog.h"

namespace ubcio {

GridHandle GridBuilder::build(GridBackend& backend, const RectilinearMesh& mesh) {
  for (int a = 0; a < 3; ++a) {
    if (static_cast<index_t>(mesh.axes[a].size()) != mesh.node_dims[a]) {
      UBCIO_THROW(FormatError, "Mesh '" + mesh.filename + "' axis " + std::to_string(a) + " has " +
                               std::to_string(mesh.axes[a].size()) + " coordinates for " +
                               std::to_string(mesh.node_dims[a]) + " nodes");
    }
  }

  GridHandle grid = backend.allocate_rectilinear_grid(mesh.node_dims);
  for (int a = 0; a < 3; ++a) {
    backend.set_axis_coordinates(grid, a, mesh.axes[a]);
  }

  ubcTrace() << "[ubcio] built " << to_string(mesh.format) << " grid " << grid.id << " with "
             << mesh.node_dims[0] << " x " << mesh.node_dims[1] << " x " << mesh.node_dims[2]
             << " nodes" << std::endl;
  return grid;
}

GridHandle GridBuilder::build(GridBackend& /*backend*/, const OcTreeMesh& mesh) {
  // TODO: build hexahedral cells once the index table row encoding
  // (corner triple + refinement size) has a written definition.
  UBCIO_NOT_IMPLEMENTED("OcTree cell construction for '" + mesh.filename + "' (" +
                        std::to_string(mesh.n_cells) + " cells parsed)");
}

} // namespace ubcio
