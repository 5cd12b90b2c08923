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

#include "ConversionParameters.h"
#include "../Core/UbcException.h"
#include "../Core/UbcLog.h"

#include "tinyxml2.h"

namespace ubcio {

const std::string ConversionParameters::ROOT_ELEMENT = "UbcConversion";

namespace {

std::string element_text(const tinyxml2::XMLElement* root, const char* name, bool required)
{
  const auto* elem = root->FirstChildElement(name);
  const std::string text = (elem && elem->GetText()) ? detail::trim_copy(elem->GetText()) : "";
  if (text.empty()) {
    if (required) {
      UBCIO_THROW(ConfigError, "The <" + std::string(name) + "> element is required in <" +
                               ConversionParameters::ROOT_ELEMENT + ">.");
    }
    return "";
  }
  return text;
}

ConversionParameters from_document(const tinyxml2::XMLDocument& doc, const std::string& source)
{
  const auto* root = doc.FirstChildElement(ConversionParameters::ROOT_ELEMENT.c_str());
  if (!root) {
    UBCIO_THROW(ConfigError, "The root element of '" + source + "' must be <" +
                             ConversionParameters::ROOT_ELEMENT + ">.");
  }

  ConversionParameters params;
  params.mesh_file_path = element_text(root, "Mesh_file_path", true);
  params.mesh_format = element_text(root, "Mesh_format", false);
  params.model_file_path = element_text(root, "Model_file_path", false);
  params.data_name = element_text(root, "Data_name", false);
  params.output_file_path = element_text(root, "Output_file_path", true);
  params.log_file = element_text(root, "Log_file", false);

  const std::string echo = element_text(root, "Echo_log", false);
  params.echo_log = !echo.empty() && detail::parse_bool_relaxed(echo);

  return params;
}

} // namespace

ConversionParameters ConversionParameters::from_xml_file(const std::string& xml_file)
{
  tinyxml2::XMLDocument doc;
  const auto error = doc.LoadFile(xml_file.c_str());
  if (error == tinyxml2::XML_ERROR_FILE_NOT_FOUND ||
      error == tinyxml2::XML_ERROR_FILE_COULD_NOT_BE_OPENED ||
      error == tinyxml2::XML_ERROR_FILE_READ_ERROR) {
    UBCIO_THROW(FileError, "Unable to read the job file '" + xml_file + "'.");
  }
  if (error != tinyxml2::XML_SUCCESS) {
    UBCIO_THROW(ConfigError, "The job file '" + xml_file + "' is not valid XML: " +
                             std::string(doc.ErrorStr()));
  }
  return from_document(doc, xml_file);
}

ConversionParameters ConversionParameters::from_xml_string(const std::string& xml_text)
{
  tinyxml2::XMLDocument doc;
  if (doc.Parse(xml_text.c_str()) != tinyxml2::XML_SUCCESS) {
    UBCIO_THROW(ConfigError, "The job text is not valid XML: " + std::string(doc.ErrorStr()));
  }
  return from_document(doc, "<string>");
}

UbcIOOptions ConversionParameters::to_options() const
{
  UbcIOOptions opts;
  opts.format = mesh_format;
  opts.mesh_path = mesh_file_path;
  opts.model_path = model_file_path;
  opts.data_name = data_name;
  return opts;
}

} // namespace ubcio
