/**
 * @file test_ConversionDriver.cpp
 * @brief End-to-end conversion of a UBC mesh and model to a VTK file
 */

#include <gtest/gtest.h>
#include "ubcio/Application/ConversionDriver.h"
#include "ubcio/Application/ConversionParameters.h"
#include "ubcio/Core/UbcException.h"
#include "ubcio/IO/UbcIO.h"
#include "ubcio/Tests/Unit/UbcTestFiles.h"

#include <vtkCellData.h>
#include <vtkDataArray.h>
#include <vtkRectilinearGrid.h>
#include <vtkSmartPointer.h>
#include <vtkXMLRectilinearGridReader.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace ubcio;

class ConversionDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto dir = std::filesystem::temp_directory_path();
        output_ = (dir / "ubcio_driver_test.vtr").string();
        log_ = (dir / "ubcio_driver_test.log").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(output_, ec);
        std::filesystem::remove(log_, ec);
    }

    std::string output_;
    std::string log_;
};

TEST_F(ConversionDriverTest, ConvertsMeshAndModel) {
    test::ScratchFile mesh("driver.msh", "2 2 1\n0 0 0\n1.0 1.0\n1.0 1.0\n1.0\n");
    test::ScratchFile model("driver.den", "1\n2\n3\n4\n");

    ConversionParameters params;
    params.mesh_file_path = mesh.path();
    params.model_file_path = model.path();
    params.data_name = "Density";
    params.output_file_path = output_;
    params.log_file = log_;

    ConversionDriver::run(params);

    vtkSmartPointer<vtkXMLRectilinearGridReader> reader =
        vtkSmartPointer<vtkXMLRectilinearGridReader>::New();
    reader->SetFileName(output_.c_str());
    reader->Update();
    vtkRectilinearGrid* grid = reader->GetOutput();
    EXPECT_EQ(grid->GetNumberOfCells(), 4);
    ASSERT_NE(grid->GetCellData()->GetArray("Density"), nullptr);

    std::ifstream log(log_);
    std::stringstream contents;
    contents << log.rdbuf();
    EXPECT_NE(contents.str().find("Mesh format: ubc3d"), std::string::npos) << contents.str();
    EXPECT_NE(contents.str().find("Grid cells: 4"), std::string::npos) << contents.str();
}

TEST_F(ConversionDriverTest, FromJobFile) {
    test::ScratchFile mesh("job_driver.msh", "1 1 1\n0 0 0\n1\n1\n1\n");
    test::ScratchFile job("driver_job.xml",
                          "<UbcConversion>\n"
                          "  <Mesh_file_path>" + mesh.path() + "</Mesh_file_path>\n"
                          "  <Output_file_path>" + output_ + "</Output_file_path>\n"
                          "</UbcConversion>\n");

    ConversionDriver::run(job.path());
    EXPECT_TRUE(std::filesystem::exists(output_));
}

TEST_F(ConversionDriverTest, ModelMismatchWritesNothing) {
    test::ScratchFile mesh("bad_driver.msh", "2 2 1\n0 0 0\n1.0 1.0\n1.0 1.0\n1.0\n");
    test::ScratchFile model("bad_driver.den", "1 2 3\n");

    ConversionParameters params;
    params.mesh_file_path = mesh.path();
    params.model_file_path = model.path();
    params.output_file_path = output_;

    EXPECT_THROW(ConversionDriver::run(params), SizeMismatchError);
    EXPECT_FALSE(std::filesystem::exists(output_));
}

TEST_F(ConversionDriverTest, ExecuteReturnsZeroOnSuccess) {
    test::ScratchFile mesh("execute_ok.msh", "1 1 1\n0 0 0\n1\n1\n1\n");
    test::ScratchFile job("execute_ok.xml",
                          "<UbcConversion>\n"
                          "  <Mesh_file_path>" + mesh.path() + "</Mesh_file_path>\n"
                          "  <Output_file_path>" + output_ + "</Output_file_path>\n"
                          "</UbcConversion>\n");

    std::ostringstream err;
    EXPECT_EQ(ConversionDriver::execute(job.path(), err), 0);
    EXPECT_TRUE(err.str().empty()) << err.str();
    EXPECT_TRUE(std::filesystem::exists(output_));
}

TEST_F(ConversionDriverTest, ExecuteReportsConversionErrors) {
    std::ostringstream err;
    EXPECT_EQ(ConversionDriver::execute(test::missing_path("execute_job.xml"), err), 2);
    EXPECT_FALSE(err.str().empty());
}

TEST_F(ConversionDriverTest, ExecuteReportsOtherExceptions) {
    UbcIO::register_builder("throwing_builder",
        [](GridBackend&, const UbcIOOptions&) -> GridHandle {
            throw std::runtime_error("builder gave up");
        });

    test::ScratchFile mesh("execute_throw.msh", "1 1 1\n0 0 0\n1\n1\n1\n");
    test::ScratchFile job("execute_throw.xml",
                          "<UbcConversion>\n"
                          "  <Mesh_file_path>" + mesh.path() + "</Mesh_file_path>\n"
                          "  <Mesh_format>throwing_builder</Mesh_format>\n"
                          "  <Output_file_path>" + output_ + "</Output_file_path>\n"
                          "</UbcConversion>\n");

    std::ostringstream err;
    const int status = ConversionDriver::execute(job.path(), err);
    UbcIO::unregister_builder("throwing_builder");

    EXPECT_EQ(status, 3);
    EXPECT_NE(err.str().find("builder gave up"), std::string::npos) << err.str();
    EXPECT_FALSE(std::filesystem::exists(output_));
}
