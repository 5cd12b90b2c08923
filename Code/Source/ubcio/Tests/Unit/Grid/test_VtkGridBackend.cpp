/**
 * @file test_VtkGridBackend.cpp
 * @brief Unit tests for the VTK grid backend
 */

#include <gtest/gtest.h>
#include "ubcio/Grid/VtkGridBackend.h"
#include "ubcio/IO/UbcIO.h"
#include "ubcio/Core/UbcException.h"
#include "ubcio/Tests/Unit/UbcTestFiles.h"

#include <vtkCellData.h>
#include <vtkDataArray.h>
#include <vtkRectilinearGrid.h>
#include <vtkUnstructuredGrid.h>
#include <vtkXMLRectilinearGridReader.h>

#include <filesystem>

using namespace ubcio;

TEST(VtkGridBackend, RectilinearGridWithCellData) {
    VtkGridBackend backend;
    const GridHandle grid = backend.allocate_rectilinear_grid({{3, 3, 2}});
    backend.set_axis_coordinates(grid, 0, {0.0, 1.0, 2.0});
    backend.set_axis_coordinates(grid, 1, {0.0, 1.0, 2.0});
    backend.set_axis_coordinates(grid, 2, {0.0, 1.0});
    backend.attach_cell_array(grid, "Density", {1.0, 2.0, 3.0, 4.0});

    vtkRectilinearGrid* rgrid = backend.rectilinear_grid(grid);
    ASSERT_NE(rgrid, nullptr);
    EXPECT_EQ(rgrid->GetNumberOfCells(), 4);
    EXPECT_EQ(rgrid->GetNumberOfPoints(), 18);
    EXPECT_DOUBLE_EQ(rgrid->GetXCoordinates()->GetTuple1(2), 2.0);

    vtkDataArray* data = rgrid->GetCellData()->GetArray("Density");
    ASSERT_NE(data, nullptr);
    EXPECT_DOUBLE_EQ(data->GetTuple1(3), 4.0);
}

TEST(VtkGridBackend, Rejections) {
    VtkGridBackend backend;
    EXPECT_THROW(backend.allocate_rectilinear_grid({{0, 2, 2}}), FormatError);

    const GridHandle grid = backend.allocate_rectilinear_grid({{2, 2, 2}});
    EXPECT_THROW(backend.set_axis_coordinates(grid, 0, {0.0, 1.0, 2.0}), FormatError);
    EXPECT_THROW(backend.set_axis_coordinates(grid, 3, {0.0, 1.0}), RegistryError);
    EXPECT_THROW(backend.attach_cell_array(grid, "x", {1.0, 2.0}), SizeMismatchError);
    EXPECT_THROW(backend.dataset(GridHandle{42}), RegistryError);

    const GridHandle ugrid = backend.allocate_unstructured_grid();
    EXPECT_NE(backend.unstructured_grid(ugrid), nullptr);
    EXPECT_EQ(backend.rectilinear_grid(ugrid), nullptr);
    EXPECT_THROW(backend.set_axis_coordinates(ugrid, 0, {0.0}), RegistryError);
}

TEST(VtkGridBackend, WriteAndReadBackVtr) {
    test::ScratchFile mesh("vtk.msh", "2 1 1\n0 0 0\n2*5.0\n1\n1\n");
    test::ScratchFile model("vtk.den", "3.5 4.5\n");

    VtkGridBackend backend;
    const GridHandle grid = UbcIO::load_mesh_data_3d(backend, mesh.path(), model.path(), "Rho");

    const auto out = std::filesystem::temp_directory_path() / "ubcio_vtk_backend_test.vtr";
    backend.write(grid, out.string());
    ASSERT_TRUE(std::filesystem::exists(out));

    vtkSmartPointer<vtkXMLRectilinearGridReader> reader =
        vtkSmartPointer<vtkXMLRectilinearGridReader>::New();
    reader->SetFileName(out.string().c_str());
    reader->Update();
    vtkRectilinearGrid* read = reader->GetOutput();
    EXPECT_EQ(read->GetNumberOfCells(), 2);
    vtkDataArray* rho = read->GetCellData()->GetArray("Rho");
    ASSERT_NE(rho, nullptr);
    EXPECT_DOUBLE_EQ(rho->GetTuple1(1), 4.5);

    std::filesystem::remove(out);
}

TEST(VtkGridBackend, WriteRejectsMismatchedExtension) {
    VtkGridBackend backend;
    const GridHandle grid = backend.allocate_rectilinear_grid({{2, 2, 2}});
    const auto dir = std::filesystem::temp_directory_path();
    EXPECT_THROW(backend.write(grid, (dir / "ubcio_wrong.vtu").string()), FileError);
    EXPECT_THROW(backend.write(grid, (dir / "ubcio_wrong.obj").string()), FileError);
}
