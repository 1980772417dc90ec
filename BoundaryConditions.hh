////////////////////////////////////////////////////////////////////////////////
// BoundaryConditions.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Supports and point loads applied to the frame's nodes, plus the support
//  configurations offered for the simply spanning design domain.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef BOUNDARYCONDITIONS_HH
#define BOUNDARYCONDITIONS_HH

#include <Eigen/Dense>
#include <array>
#include <iostream>
#include <stdexcept>
#include <string>

struct Support {
    // Fixed: u, v and rotation; Pinned: u and v; Roller: v only.
    enum class Type : int { Fixed = 0, Pinned = 1, Roller = 2 };

    Support(int n, Type t) : node(n), type(t) { }

    int node;
    Type type;

    bool constrains(int d) const {
        if (type == Type::Fixed)  return true;
        if (type == Type::Pinned) return d < 2;
        return d == 1;
    }
};

struct PointLoad {
    PointLoad(int n, const Eigen::Vector2d &f) : node(n), force(f) { }
    int node;
    Eigen::Vector2d force;
};

// Supports at the left and right ends of the span.
enum class SupportCondition : int { PinnedRoller = 0, FixedFixed = 1, PinnedPinned = 2 };

inline const std::array<std::string, 3> &supportConditionNames() {
    static const std::array<std::string, 3> names{{ "Pinned-Roller", "Fixed-Fixed", "Pinned-Pinned" }};
    return names;
}

inline const std::string &supportConditionName(SupportCondition c) { return supportConditionNames().at(int(c)); }

inline SupportCondition supportConditionFromName(const std::string &n) {
    const auto &names = supportConditionNames();
    for (size_t i = 0; i < names.size(); ++i)
        if (names[i] == n) return SupportCondition(i);
    throw std::runtime_error("Unknown support condition " + n);
}

inline Support::Type leftSupportType(SupportCondition c) {
    return (c == SupportCondition::FixedFixed) ? Support::Type::Fixed : Support::Type::Pinned;
}

inline Support::Type rightSupportType(SupportCondition c) {
    if (c == SupportCondition::FixedFixed)   return Support::Type::Fixed;
    if (c == SupportCondition::PinnedPinned) return Support::Type::Pinned;
    return Support::Type::Roller;
}

inline std::ostream &operator<<(std::ostream &os, SupportCondition c) { return os << supportConditionName(c); }

inline std::istream &operator>>(std::istream &is, SupportCondition &c) {
    std::string n;
    if (is >> n) c = supportConditionFromName(n);
    return is;
}

#endif /* end of include guard: BOUNDARYCONDITIONS_HH */
