////////////////////////////////////////////////////////////////////////////////
// SectionProperties.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Cross-sectional properties of a doubly symmetric I-section.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef SECTIONPROPERTIES_HH
#define SECTIONPROPERTIES_HH

#include <iostream>

struct ISection {
    double B  = 0.150; // flange width
    double D  = 0.300; // total depth
    double tw = 0.008; // web thickness
    double tf = 0.012; // flange thickness

    friend std::ostream &operator<<(std::ostream &os, const ISection &s) {
        return os << s.B << ' ' << s.D << ' ' << s.tw << ' ' << s.tf;
    }
};

struct SectionProperties {
    double area    = 0.0;
    double inertia = 0.0; // second moment of area about the strong axis
};

// Outer rectangle minus the two rectangles beside the web.
// Throws InvalidGeometryError for degenerate sections (e.g. tf >= D / 2).
SectionProperties sectionProperties(const ISection &s);

#endif /* end of include guard: SECTIONPROPERTIES_HH */
