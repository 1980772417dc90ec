#include "OptimizerParams.hh"
#include "StructuralErrors.hh"
#include <fstream>

void OptimizerParams::validate() const {
    if ((span <= 0) || (height <= 0)) throw InvalidGeometryError("Span and height must be positive");
    if (load < 0)                     throw std::runtime_error("Load magnitude must be non-negative");
    if (youngsModulus <= 0)           throw std::runtime_error("Young's modulus must be positive");
    if ((prune.removalRatio <= 0) || (prune.removalRatio > 1)) throw std::runtime_error("Removal ratio must lie in (0, 1]");
    if ((prune.softKillFactor <= 0) || (prune.softKillFactor >= 1)) throw std::runtime_error("Soft-kill factor must lie in (0, 1)");
    if ((prune.safetyFloor < 0) || (convergenceFloor < 0)) throw std::runtime_error("Member floors must be non-negative");
    if (symmetryTolerance <= 0)       throw std::runtime_error("Symmetry tolerance must be positive");
    if (maxIterations < 1)            throw std::runtime_error("At least one iteration must be allowed");
}

std::ostream &operator<<(std::ostream &os, const OptimizerParams &p) {
    os << p.span << ' ' << p.height << ' ' << p.load / 1e3 << ' ' << p.support << std::endl
       << p.youngsModulus / 1e9 << std::endl
       << 1e3 * p.section.B << ' ' << 1e3 * p.section.D << ' ' << 1e3 * p.section.tw << ' ' << 1e3 * p.section.tf << std::endl
       << p.prune.removalRatio << ' ' << p.prune.safetyFloor << ' ' << p.convergenceFloor << std::endl;
    return os;
}

std::istream &operator>>(std::istream &is, OptimizerParams &p) {
    OptimizerParams result = p;
    double loadKN, EGPa;
    ISection mm;
    is >> result.span >> result.height >> loadKN >> result.support
       >> EGPa
       >> mm.B >> mm.D >> mm.tw >> mm.tf
       >> result.prune.removalRatio >> result.prune.safetyFloor >> result.convergenceFloor;
    if (!is) return is;

    result.load = 1e3 * loadKN;
    result.youngsModulus = 1e9 * EGPa;
    result.section.B  = mm.B  / 1e3;
    result.section.D  = mm.D  / 1e3;
    result.section.tw = mm.tw / 1e3;
    result.section.tf = mm.tf / 1e3;
    p = result;
    return is;
}

OptimizerParams readConfig(const std::string &path) {
    std::ifstream inFile(path);
    if (!inFile.is_open()) throw std::runtime_error(std::string("Couldn't open input file ") + path);
    OptimizerParams p;
    if (!(inFile >> p)) throw std::runtime_error(std::string("Malformed config file ") + path);
    p.validate();
    return p;
}

void writeConfig(const std::string &path, const OptimizerParams &p) {
    std::ofstream outFile(path);
    if (!outFile.is_open()) throw std::runtime_error(std::string("Couldn't open output file ") + path);
    outFile << p;
}
