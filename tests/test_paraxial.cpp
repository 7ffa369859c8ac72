#include "paraxial.h"
#include "test_util.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace
{
constexpr double kEps = 1e-9;
const double kInf = std::numeric_limits<double>::infinity();
} // namespace

TEST(Paraxial, Matrices)
{
    Matrix2d t = translation_matrix(7.0);
    EXPECT_DOUBLE_EQ(t(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(t(0, 1), 7.0);
    EXPECT_DOUBLE_EQ(t(1, 0), 0.0);
    EXPECT_DOUBLE_EQ(t(1, 1), 1.0);

    Matrix2d r = refraction_matrix(1.0, 1.5, 100.0);
    EXPECT_NEAR(r(1, 0), (1.0 - 1.5) / (1.5 * 100.0), kEps);
    EXPECT_NEAR(r(1, 1), 1.0 / 1.5, kEps);

    Matrix2d flat = refraction_matrix(1.0, 1.5, kInf);
    EXPECT_DOUBLE_EQ(flat(1, 0), 0.0);
}

TEST(Paraxial, EmptySystemIsIdentity)
{
    OpticalSystem sys;
    EXPECT_TRUE(system_matrix(sys).isIdentity());
    EXPECT_FALSE(calculate_system_focal_length(sys).has_value());
    EXPECT_FALSE(image_distance(sys, 100.0).has_value());
    EXPECT_FALSE(numerical_aperture(sys).has_value());
}

TEST(Paraxial, SingleElementMatchesLensmaker)
{
    OpticalSystem sys = single_lens_system(biconvex_record());
    const Element &e = sys.elements()[0];

    std::optional<double> f = calculate_system_focal_length(sys);
    ASSERT_TRUE(f.has_value());
    EXPECT_NEAR(*f, *element_focal_length(e), 1e-6);
    EXPECT_NEAR(*f, 97.58, 0.05);
    EXPECT_NEAR(*back_focal_length(sys), *e.back_focal_length(), 1e-6);
    EXPECT_NEAR(*front_focal_length(sys), *e.front_focal_length(), 1e-6);
}

TEST(Paraxial, AsymmetricElementFocalDistances)
{
    OpticalSystem sys = single_lens_system(make_record(50.0, kInf, 6.0, 25.0, 1.5168));
    const Element &e = sys.elements()[0];
    EXPECT_NEAR(*back_focal_length(sys), *e.back_focal_length(), 1e-6);
    EXPECT_NEAR(*front_focal_length(sys), *e.front_focal_length(), 1e-6);
    EXPECT_LT(*back_focal_length(sys), *front_focal_length(sys));
}

TEST(Paraxial, UndefinedPowerPropagates)
{
    // A plane window has no focal length, and neither does any system holding one
    OpticalSystem window = single_lens_system(make_record(kInf, kInf, 10.0, 30.0, 1.5168));
    EXPECT_FALSE(element_focal_length(window.elements()[0]).has_value());
    EXPECT_FALSE(calculate_system_focal_length(window).has_value());
    EXPECT_FALSE(back_focal_length(window).has_value());
    EXPECT_FALSE(f_number(window).has_value());

    OpticalSystem mixed;
    ASSERT_TRUE(mixed.add_lens(biconvex_record()));
    ASSERT_TRUE(mixed.add_lens(make_record(kInf, kInf, 2.0, 25.0, 1.5168), 5.0));
    EXPECT_FALSE(calculate_system_focal_length(mixed).has_value());
}

TEST(Paraxial, AfocalPairHasNoFocalLength)
{
    // Keplerian pair: separation f1 + f2 between principal planes makes C vanish
    OpticalSystem singlet = single_lens_system(biconvex_record());
    const double f = *calculate_system_focal_length(singlet);
    const double bfl = *back_focal_length(singlet);

    OpticalSystem pair;
    ASSERT_TRUE(pair.add_lens(biconvex_record()));
    ASSERT_TRUE(pair.add_lens(biconvex_record(), 2.0 * bfl));
    std::optional<double> efl = calculate_system_focal_length(pair);
    EXPECT_FALSE(efl.has_value());
    EXPECT_GT(f, 0.0);
}

TEST(Paraxial, TwoLensCombination)
{
    OpticalSystem pair;
    ASSERT_TRUE(pair.add_lens(biconvex_record()));
    ASSERT_TRUE(pair.add_lens(biconvex_record(), 2.0));

    // Gullstrand: 1/f = 1/f1 + 1/f2 - d/(f1 f2) with d between principal planes
    OpticalSystem single = single_lens_system(biconvex_record());
    const double f1 = *calculate_system_focal_length(single);
    const double hp = f1 - *back_focal_length(single); // principal plane depth
    const double d = hp + 2.0 + hp;
    const double expected = 1.0 / (2.0 / f1 - d / (f1 * f1));

    std::optional<double> f = calculate_system_focal_length(pair);
    ASSERT_TRUE(f.has_value());
    EXPECT_NEAR(*f, expected, 1e-6);
}

TEST(Paraxial, ImageDistanceAndMagnification)
{
    OpticalSystem sys = single_lens_system(biconvex_record());
    const double f = *calculate_system_focal_length(sys);
    const double hp = f - *back_focal_length(sys);

    const double s_o = 1000.0;
    std::optional<double> s_i = image_distance(sys, s_o);
    ASSERT_TRUE(s_i.has_value());

    // Gaussian lens formula between principal planes
    const double so_p = s_o + hp, si_p = *s_i + hp;
    EXPECT_NEAR(1.0 / so_p + 1.0 / si_p, 1.0 / f, 1e-9);

    std::optional<double> m = lateral_magnification(sys, s_o);
    ASSERT_TRUE(m.has_value());
    EXPECT_NEAR(*m, -si_p / so_p, 1e-9);
    EXPECT_LT(*m, 0.0);
}

TEST(Paraxial, ObjectAtFrontFocalPlane)
{
    OpticalSystem sys = single_lens_system(biconvex_record());
    const double ffl = *front_focal_length(sys);
    EXPECT_FALSE(image_distance(sys, ffl).has_value());
    EXPECT_FALSE(lateral_magnification(sys, ffl).has_value());

    // Distant objects image near the back focal plane
    EXPECT_NEAR(*image_distance(sys, 1e9), *back_focal_length(sys), 1e-4);
}

TEST(Paraxial, ApertureFigures)
{
    OpticalSystem sys = single_lens_system(biconvex_record());
    const double f = *calculate_system_focal_length(sys);
    EXPECT_NEAR(*numerical_aperture(sys), 12.5 / f, kEps);
    EXPECT_NEAR(*numerical_aperture(sys, 1.333), 1.333 * 12.5 / *calculate_system_focal_length(sys, 1.333), kEps);
    EXPECT_NEAR(*f_number(sys), f / 25.0, kEps);
}

TEST(Paraxial, ImmersionLengthensFocus)
{
    OpticalSystem sys = single_lens_system(biconvex_record());
    EXPECT_GT(*calculate_system_focal_length(sys, 1.333), *calculate_system_focal_length(sys, 1.0));
}

TEST(Chromatic, SingletShowsLongitudinalColour)
{
    LensRecord rec = biconvex_record();
    rec.material = "BK7";
    OpticalSystem sys = single_lens_system(rec);

    GlassCatalog cat = GlassCatalog::standard();
    std::string error;
    std::optional<ChromaticShift> cs = chromatic_focal_shift(sys, cat.index_function(), 20.0, 1.0, &error);
    ASSERT_TRUE(cs.has_value()) << error;

    EXPECT_LT(cs->f_F, cs->f_d);
    EXPECT_LT(cs->f_d, cs->f_C);
    EXPECT_NEAR(cs->longitudinal, cs->f_C - cs->f_F, kEps);
    // Roughly f / V for a thin singlet
    EXPECT_NEAR(cs->longitudinal, cs->f_d / 64.17, 0.1 * cs->f_d / 64.17);
    EXPECT_FALSE(cs->corrected);
}

TEST(Chromatic, AchromatReducesShift)
{
    GlassCatalog cat = GlassCatalog::standard();

    LensRecord crown = make_record(62.8, -45.7, 4.0, 25.0, 1.5168);
    crown.material = "BK7";
    LensRecord flint = make_record(-45.7, -128.2, 2.5, 25.0, 1.62004);
    flint.material = "F2";

    OpticalSystem doublet;
    ASSERT_TRUE(doublet.add_lens(crown));
    ASSERT_TRUE(doublet.add_lens(flint, 0.0));

    LensRecord single_rec = biconvex_record();
    single_rec.material = "BK7";
    OpticalSystem singlet = single_lens_system(single_rec);

    std::optional<ChromaticShift> d = chromatic_focal_shift(doublet, cat.index_function());
    std::optional<ChromaticShift> s = chromatic_focal_shift(singlet, cat.index_function());
    ASSERT_TRUE(d && s);
    EXPECT_LT(d->longitudinal, s->longitudinal);
}

TEST(Chromatic, FixedIndexIsCorrected)
{
    OpticalSystem sys = single_lens_system(biconvex_record());
    GlassCatalog cat = GlassCatalog::standard();
    std::optional<ChromaticShift> cs = chromatic_focal_shift(sys, cat.index_function());
    ASSERT_TRUE(cs.has_value());
    EXPECT_NEAR(cs->longitudinal, 0.0, kEps);
    EXPECT_TRUE(cs->corrected);
}

TEST(Chromatic, UnknownGlassFails)
{
    LensRecord rec = biconvex_record();
    rec.material = "unobtainium";
    OpticalSystem sys = single_lens_system(rec);
    GlassCatalog cat = GlassCatalog::standard();
    std::string error;
    EXPECT_FALSE(chromatic_focal_shift(sys, cat.index_function(), 20.0, 1.0, &error).has_value());
    EXPECT_FALSE(error.empty());
}
