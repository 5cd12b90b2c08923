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

#ifndef UBCIO_CONVERSION_PARAMETERS_H
#define UBCIO_CONVERSION_PARAMETERS_H

#include "../Core/UbcTypes.h"

#include <string>

namespace ubcio {

/**
 * @brief Settings of one mesh (+ model) to VTK conversion job
 *
 * Read from an XML file of the form
 *
 * @code
 * <UbcConversion>
 *   <Mesh_file_path> mesh.msh </Mesh_file_path>
 *   <Mesh_format> ubc3d </Mesh_format>
 *   <Model_file_path> density.mod </Model_file_path>
 *   <Data_name> Density </Data_name>
 *   <Output_file_path> density.vtr </Output_file_path>
 *   <Log_file> conversion.log </Log_file>
 *   <Echo_log> true </Echo_log>
 * </UbcConversion>
 * @endcode
 *
 * Only Mesh_file_path and Output_file_path are required.
 */
struct ConversionParameters {
  static const std::string ROOT_ELEMENT;

  std::string mesh_file_path;
  std::string mesh_format;
  std::string model_file_path;
  std::string data_name;
  std::string output_file_path;
  std::string log_file;
  bool echo_log = false;

  /**
   * @throws FileError if the file cannot be loaded
   * @throws ConfigError if the document is malformed or incomplete
   */
  static ConversionParameters from_xml_file(const std::string& xml_file);

  /**
   * @brief Parse a job from XML text
   * @throws ConfigError if the document is malformed or incomplete
   */
  static ConversionParameters from_xml_string(const std::string& xml_text);

  /// Loader options for UbcIO::load
  UbcIOOptions to_options() const;
};

} // namespace ubcio

#endif // UBCIO_CONVERSION_PARAMETERS_H
