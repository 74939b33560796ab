#include "CaseAlgorithms.h"

namespace CaseAlgorithms {

std::optional<std::string> ollAlgorithm(OllCase ollCase) {
    switch (ollCase) {
        // Edge orientation
        case OllCase::Dot:      return std::string("F R U R' U' F' f R U R' U' f'");
        case OllCase::LShape:   return std::string("f R U R' U' f'");
        case OllCase::Line:     return std::string("F R U R' U' F'");
        // Corner orientation
        case OllCase::Sune:     return std::string("R U2 R' U' R U' R'");
        case OllCase::AntiSune: return std::string("R U R' U R U2 R'");
        case OllCase::H:        return std::string("R U R' U R U' R' U R U2 R'");
        case OllCase::Pi:       return std::string("R U2 R2 U' R2 U' R2 U2 R");
        case OllCase::U:        return std::string("R2 D R' U2 R D' R' U2 R'");
        case OllCase::T:        return std::string("r U R' U' r' F R F'");
        case OllCase::L:        return std::string("F R' F' r U R U' r'");
        case OllCase::Unknown:  break;
    }
    return std::nullopt;
}

std::optional<std::string> pllAlgorithm(PllCase pllCase) {
    switch (pllCase) {
        case PllCase::Diagonal:   return std::string("F R U' R' U' R U R' F' R U R' U' R' F R F'");
        case PllCase::Headlights: return std::string("R U R' U' R' F R2 U' R' U' R U R' F'");
        case PllCase::H:          return std::string("M2 U M2 U2 M2 U M2");
        case PllCase::Z:          return std::string("M' U M2 U M2 U M' U2 M2");
        case PllCase::Ua:         return std::string("R U' R U R U R U' R' U' R2");
        case PllCase::Ub:         return std::string("R2 U R U R' U' R' U' R' U R'");
        case PllCase::Auf:
        case PllCase::Solved:
        case PllCase::Unknown:    break;
    }
    return std::nullopt;
}

}
