#pragma once

#include <ostream>
#include <vector>

#include "CubeTypes.h"

// 2-look OLL: edge orientation cases first, then the 7 corner cases
enum class OllCase {
    Dot,
    LShape,
    Line,
    Sune,
    AntiSune,
    H,
    Pi,
    U,
    T,
    L,
    Unknown
};

const char* ollCaseName(OllCase ollCase);
std::ostream& operator<<(std::ostream& os, OllCase ollCase);

namespace OllClassifier {

// topPieces: the 4 edges and 4 corners of the last layer
OllCase identify(const std::vector<Piece>& topPieces, const Piece& topCenter);

}
