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

#ifndef UBCIO_UBC_IO_H
#define UBCIO_UBC_IO_H

#include "../Core/UbcTypes.h"
#include "../Grid/GridBackend.h"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ubcio {

/**
 * @brief UBC format registry and combined mesh + model loading
 *
 * This class manages:
 * - A registry of grid builders keyed by format name
 * - Format detection from file content
 * - One-call loading of a mesh file with an optional model file
 *
 * Built-in formats: "ubc2d", "ubc3d" and "ubcoctree".
 */
class UbcIO {
public:
  /// Builds a grid in the backend from the files named in the options
  using GridBuilderFn = std::function<GridHandle(GridBackend&, const UbcIOOptions&)>;

  // ---- Registry management ----

  /**
   * @brief Register a grid builder for a format
   * @param format Format identifier (aliases are normalized first)
   */
  static void register_builder(const std::string& format, GridBuilderFn builder);

  static void unregister_builder(const std::string& format);

  static bool has_builder(const std::string& format);

  /**
   * @brief Registered format names, sorted
   */
  static std::vector<std::string> available_formats();

  // ---- Main I/O interface ----

  /**
   * @brief Build a grid from options.mesh_path and, when options.model_path
   *        is set, attach the model as cell data
   *
   * An empty options.format is detected from the mesh file content.
   *
   * @throws FileError if the mesh file does not exist
   * @throws RegistryError if no builder is registered for the format
   */
  static GridHandle load(GridBackend& backend, const UbcIOOptions& options);

  /**
   * @brief UBC 2D mesh + 2D model to a grid with cell data
   * @param data_name Cell array name; empty uses the model file base name
   */
  static GridHandle load_mesh_data_2d(GridBackend& backend,
                                      const std::string& mesh_file,
                                      const std::string& model_file,
                                      const std::string& data_name = "");

  /**
   * @brief UBC 3D mesh + 3D model to a grid with cell data
   */
  static GridHandle load_mesh_data_3d(GridBackend& backend,
                                      const std::string& mesh_file,
                                      const std::string& model_file,
                                      const std::string& data_name = "");

  // ---- Format detection ----

  /**
   * @brief Guess the UBC mesh flavour from file content
   *
   * A single value on the first content line is a 2D mesh. More than five
   * content lines with a single integer on the fourth is an OcTree mesh.
   * Anything else is a 3D mesh. A one-cell OcTree file is reported as 3D.
   *
   * @return Format identifier (empty if the file has no content)
   */
  static std::string detect_format(const std::string& mesh_path);

  /**
   * @brief Lower-case and map aliases ("2d", "mesh3d", "octree", ...) to
   *        canonical names
   */
  static std::string normalize_format(const std::string& format);

  // ---- Format registration helpers ----

  /**
   * @brief Register the ubc2d, ubc3d and ubcoctree builders (idempotent)
   */
  static void register_builtin_formats();

private:
  static std::unordered_map<std::string, GridBuilderFn>& builders();

  // Body of register_builtin_formats, run exactly once
  static void register_builtin_builders();
};

} // namespace ubcio

#endif // UBCIO_UBC_IO_H
