#include "prescription.h"
#include "paraxial.h"

#include <gtest/gtest.h>

#include <cmath>
#include <fstream>
#include <string>

namespace
{
std::string write_temp(const std::string &name, const std::string &contents)
{
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << contents;
    return path;
}

std::string sample(const char *file)
{
    return std::string(LENSTRACE_SOURCE_DIR) + "/lenses/" + file;
}
} // namespace

TEST(Prescription, ParseRadius)
{
    double r = 0;
    EXPECT_TRUE(parse_radius("-45.7", r));
    EXPECT_DOUBLE_EQ(r, -45.7);
    EXPECT_TRUE(parse_radius("inf", r));
    EXPECT_TRUE(std::isinf(r));
    EXPECT_TRUE(parse_radius("flat", r));
    EXPECT_TRUE(std::isinf(r));
    EXPECT_FALSE(parse_radius("abc", r));
    EXPECT_FALSE(parse_radius("12x", r));
}

TEST(Prescription, LoadDoublet)
{
    OpticalSystem sys;
    ASSERT_TRUE(load_prescription(sample("doublet.lens").c_str(), sys));
    EXPECT_EQ(sys.name(), "Achromatic doublet");
    ASSERT_EQ(sys.num_elements(), 2);
    EXPECT_EQ(sys.elements()[0].record().material, "BK7");
    EXPECT_EQ(sys.elements()[1].record().material, "F2");
    EXPECT_DOUBLE_EQ(sys.elements()[1].front().vertex, 4.0);
    EXPECT_NEAR(sys.total_length(), 6.5, 1e-12);
    EXPECT_TRUE(calculate_system_focal_length(sys).has_value());

    RayBundle rays = trace_system_parallel_rays(sys, 21);
    for (const Ray &r : rays)
        EXPECT_TRUE(r.alive());
}

TEST(Prescription, SampleLensesLoad)
{
    for (const char *file : {"biconvex_bk7.lens", "triplet.lens", "plano_window.lens"})
    {
        OpticalSystem sys;
        EXPECT_TRUE(load_prescription(sample(file).c_str(), sys)) << file;
        EXPECT_FALSE(sys.empty()) << file;
    }
}

TEST(Prescription, TripletFocalLength)
{
    OpticalSystem sys;
    ASSERT_TRUE(load_prescription(sample("triplet.lens").c_str(), sys));
    ASSERT_EQ(sys.num_elements(), 3);
    std::optional<double> f = calculate_system_focal_length(sys);
    ASSERT_TRUE(f.has_value());
    EXPECT_GT(*f, 30.0);
    EXPECT_LT(*f, 80.0);
}

TEST(Prescription, SkipsMalformedLines)
{
    std::string path = write_temp("lenstrace_malformed.lens",
                                  "name: Test\n"
                                  "elements:\n"
                                  "  100 -100 5 25 1.5168 0\n"
                                  "  this is not a lens\n"
                                  "  100 -100 5 25 1.5168 7 BK7  # trailing comment\n");
    OpticalSystem sys;
    ASSERT_TRUE(load_prescription(path.c_str(), sys));
    ASSERT_EQ(sys.num_elements(), 2);
    EXPECT_EQ(sys.elements()[1].record().material, "BK7");
    EXPECT_DOUBLE_EQ(sys.gaps()[0], 7.0);
}

TEST(Prescription, InvalidElementFails)
{
    std::string path = write_temp("lenstrace_invalid.lens",
                                  "name: Broken\n"
                                  "elements:\n"
                                  "  100 -100 5 50 1.5168 0\n");
    OpticalSystem sys;
    EXPECT_FALSE(load_prescription(path.c_str(), sys));
    EXPECT_TRUE(sys.empty());
}

TEST(Prescription, NoElements)
{
    std::string path = write_temp("lenstrace_empty.lens", "name: Nothing\nelements:\n# none\n");
    OpticalSystem sys;
    EXPECT_FALSE(load_prescription(path.c_str(), sys));
}

TEST(Prescription, MissingFile)
{
    OpticalSystem sys;
    EXPECT_FALSE(load_prescription("/nonexistent/lens.lens", sys));
}
