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

#include "ConversionDriver.h"
#include "ConversionParameters.h"
#include "../Core/UbcException.h"
#include "../Core/UbcLog.h"
#include "../Core/UbcLogger.h"
#include "../Grid/VtkGridBackend.h"
#include "../IO/UbcIO.h"

#include <vtkDataSet.h>

#include <exception>
#include <ostream>

namespace ubcio {

void ConversionDriver::run(const std::string& xml_file)
{
  ubcTrace() << "[ubc2vtk] ConversionDriver::run(xml_file='" << xml_file << "')" << std::endl;
  run(ConversionParameters::from_xml_file(xml_file));
}

void ConversionDriver::run(const ConversionParameters& params)
{
  UbcLogger logger;
  if (!params.log_file.empty()) {
    logger.initialize(params.log_file, params.echo_log);
  }

  logger.log_message("Mesh file:", params.mesh_file_path);
  if (!params.model_file_path.empty()) {
    logger.log_message("Model file:", params.model_file_path);
  }

  UbcIOOptions opts = params.to_options();
  if (opts.format.empty()) {
    opts.format = UbcIO::detect_format(opts.mesh_path);
  }
  logger.log_message("Mesh format:", UbcIO::normalize_format(opts.format));

  VtkGridBackend backend;
  const GridHandle grid = UbcIO::load(backend, opts);
  logger.log_message("Grid cells:", backend.dataset(grid)->GetNumberOfCells());

  backend.write(grid, params.output_file_path);
  logger.log_message("Wrote:", params.output_file_path);
}

int ConversionDriver::execute(const std::string& xml_file, std::ostream& err)
{
  try {
    run(xml_file);
  } catch (const UbcException& e) {
    err << e.what() << std::endl;
    return 2;
  } catch (const std::exception& e) {
    err << "[ubc2vtk] " << e.what() << std::endl;
    return 3;
  }

  return 0;
}

} // namespace ubcio
