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

#include "UbcIO.h"
#include "UbcMesh2DReader.h"
#include "UbcMesh3DReader.h"
#include "UbcModelReader.h"
#include "UbcOcTreeReader.h"
#include "UbcTokenizer.h"
#include "../Core/UbcException.h"
#include "../Core/UbcLog.h"
#include "../Grid/GridBuilder.h"
#include "../Grid/GridDataPlacer.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace ubcio {

// ---- Static registry storage ----

std::unordered_map<std::string, UbcIO::GridBuilderFn>& UbcIO::builders() {
  static std::unordered_map<std::string, GridBuilderFn> registry;
  return registry;
}

// ---- Builder registration ----

void UbcIO::register_builder(const std::string& format, GridBuilderFn builder) {
  std::string fmt = normalize_format(format);
  builders()[fmt] = std::move(builder);
}

void UbcIO::unregister_builder(const std::string& format) {
  builders().erase(normalize_format(format));
}

bool UbcIO::has_builder(const std::string& format) {
  register_builtin_formats();
  std::string fmt = normalize_format(format);
  return builders().find(fmt) != builders().end();
}

std::vector<std::string> UbcIO::available_formats() {
  register_builtin_formats();
  std::vector<std::string> formats;
  for (const auto& [fmt, _] : builders()) {
    formats.push_back(fmt);
  }
  std::sort(formats.begin(), formats.end());
  return formats;
}

// ---- Main I/O functions ----

GridHandle UbcIO::load(GridBackend& backend, const UbcIOOptions& options) {
  register_builtin_formats();

  if (!std::filesystem::exists(options.mesh_path)) {
    UBCIO_THROW(FileError, "File does not exist: " + options.mesh_path);
  }

  // Determine format
  std::string format = options.format;
  if (format.empty()) {
    format = detect_format(options.mesh_path);
  }
  format = normalize_format(format);

  auto it = builders().find(format);
  if (it == builders().end()) {
    UBCIO_THROW(RegistryError, "No grid builder registered for format: '" + format + "'");
  }

  ubcTrace() << "[ubcio] loading '" << options.mesh_path << "' as " << format << std::endl;

  UbcIOOptions opts = options;
  opts.format = format;
  return it->second(backend, opts);
}

GridHandle UbcIO::load_mesh_data_2d(GridBackend& backend,
                                    const std::string& mesh_file,
                                    const std::string& model_file,
                                    const std::string& data_name) {
  UbcIOOptions opts;
  opts.format = to_string(UbcFormat::Mesh2D);
  opts.mesh_path = mesh_file;
  opts.model_path = model_file;
  opts.data_name = data_name;
  return load(backend, opts);
}

GridHandle UbcIO::load_mesh_data_3d(GridBackend& backend,
                                    const std::string& mesh_file,
                                    const std::string& model_file,
                                    const std::string& data_name) {
  UbcIOOptions opts;
  opts.format = to_string(UbcFormat::Mesh3D);
  opts.mesh_path = mesh_file;
  opts.model_path = model_file;
  opts.data_name = data_name;
  return load(backend, opts);
}

// ---- Format detection ----

std::string UbcIO::detect_format(const std::string& mesh_path) {
  const auto lines = UbcTokenizer::read_content_lines(mesh_path);
  if (lines.empty()) {
    return "";
  }

  if (lines[0].tokens.size() == 1) {
    return to_string(UbcFormat::Mesh2D);
  }

  if (lines.size() > 5 && lines[3].tokens.size() == 1) {
    const std::string& token = lines[3].tokens[0];
    const bool is_integer = !token.empty() &&
        std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); });
    if (is_integer) {
      return to_string(UbcFormat::OcTree);
    }
  }

  return to_string(UbcFormat::Mesh3D);
}

std::string UbcIO::normalize_format(const std::string& format) {
  std::string fmt = format;
  std::transform(fmt.begin(), fmt.end(), fmt.begin(), ::tolower);

  // Map aliases to canonical names
  if (fmt == "2d" || fmt == "mesh2d" || fmt == "ubcmesh2d") return "ubc2d";
  if (fmt == "3d" || fmt == "mesh3d" || fmt == "ubcmesh3d" || fmt == "tensor") return "ubc3d";
  if (fmt == "octree" || fmt == "ubc_octree") return "ubcoctree";

  return fmt;
}

// ---- Built-in format registration ----

namespace {

// The model is validated and reordered before the grid exists, so a bad
// model never leaves a half-built grid in the backend.
GridHandle build_with_model(GridBackend& backend, const RectilinearMesh& mesh,
                            const ModelArray& model, const UbcIOOptions& opts) {
  const PlacedCellData placed = GridDataPlacer::place(mesh.cell_counts, model,
                                                      opts.data_name, opts.model_path);
  GridHandle grid = GridBuilder::build(backend, mesh);
  backend.attach_cell_array(grid, placed.name, placed.values);
  return grid;
}

} // namespace

void UbcIO::register_builtin_formats() {
  static const bool registered = [] {
    register_builtin_builders();
    return true;
  }();
  (void)registered;
}

void UbcIO::register_builtin_builders() {
  register_builder("ubc2d", [](GridBackend& backend, const UbcIOOptions& opts) {
    const RectilinearMesh mesh = UbcMesh2DReader::read(opts.mesh_path);
    if (opts.model_path.empty()) {
      return GridBuilder::build(backend, mesh);
    }
    const ModelArray model = UbcModelReader::read_2d(opts.model_path);
    return build_with_model(backend, mesh, model, opts);
  });

  register_builder("ubc3d", [](GridBackend& backend, const UbcIOOptions& opts) {
    const RectilinearMesh mesh = UbcMesh3DReader::read(opts.mesh_path);
    if (opts.model_path.empty()) {
      return GridBuilder::build(backend, mesh);
    }
    const ModelArray model = UbcModelReader::read_3d(opts.model_path);
    return build_with_model(backend, mesh, model, opts);
  });

  register_builder("ubcoctree", [](GridBackend& backend, const UbcIOOptions& opts) {
    const OcTreeMesh mesh = UbcOcTreeReader::read(opts.mesh_path);
    return GridBuilder::build(backend, mesh);
  });
}

// ---- Static initialization ----

struct UbcIOInitializer {
  UbcIOInitializer() {
    UbcIO::register_builtin_formats();
  }
};

static UbcIOInitializer initializer;

} // namespace ubcio
