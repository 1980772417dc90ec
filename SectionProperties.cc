#include "SectionProperties.hh"
#include "StructuralErrors.hh"
#include <sstream>

SectionProperties sectionProperties(const ISection &s) {
    auto fail = [&](const std::string &why) {
        std::stringstream ss;
        ss << "Invalid I-section (B, D, tw, tf) = (" << s.B << ", " << s.D << ", " << s.tw << ", " << s.tf << "): " << why;
        throw InvalidGeometryError(ss.str());
    };

    if ((s.B <= 0) || (s.D <= 0) || (s.tw <= 0) || (s.tf <= 0)) fail("dimensions must be positive");
    if (2 * s.tf >= s.D) fail("flange thickness must be less than half the depth");
    if (s.tw > s.B)      fail("web is wider than the flanges");

    const double hw = s.D - 2 * s.tf; // clear web height

    SectionProperties result;
    result.area    = 2 * s.B * s.tf + hw * s.tw;
    result.inertia = (s.B * s.D * s.D * s.D - (s.B - s.tw) * hw * hw * hw) / 12.0;

    if ((result.area <= 0) || (result.inertia <= 0)) fail("non-positive area or moment of inertia");
    return result;
}
