#pragma once

#include <optional>
#include <ostream>
#include <vector>

#include <glm/glm.hpp>

#include "CubeTypes.h"

enum class PllCase {
    Diagonal,
    Headlights,
    H,
    Z,
    Ua,
    Ub,
    Auf,     // permuted, but the layer is turned off its centers
    Solved,  // sentinel: last layer fully permuted
    Unknown
};

const char* pllCaseName(PllCase pllCase);
std::ostream& operator<<(std::ostream& os, PllCase pllCase);

namespace PllClassifier {

// Stickers of one side of the last layer, read in the side's direction
struct SideView {
    glm::vec3 dir{0.0f};
    std::optional<Face> corner1;
    std::optional<Face> corner2;
    std::optional<Face> edge;
    bool headlights{false};
    bool bar{false};
};

std::vector<SideView> readSides(const std::vector<Piece>& topPieces, const Piece& topCenter);

PllCase identify(const std::vector<Piece>& topPieces, const Piece& topCenter);

}
