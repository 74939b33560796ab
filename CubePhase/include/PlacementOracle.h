#pragma once

#include <optional>
#include <vector>

#include <glm/glm.hpp>

#include "CubeTypes.h"

namespace PlacementOracle {

// Position and orientation relative to a reference center in one check:
// the current center->piece vector, taken into the piece's own frame, must
// reproduce the solved-state vector.
bool isCorrectlyPlaced(const Piece& piece, const Piece& referenceCenter);

// Correctly placed relative to every center whose face the piece touches.
// Catches layers turned as a block around their own center.
bool isSeated(const Piece& piece, const std::vector<Piece>& centers);

// Does the piece carry the top center's "up" axis the same way the center does
bool isOrientedForTopLayer(const Piece& piece, const Piece& topCenter);

// World direction of the top center's up axis
glm::vec3 upDirection(const Piece& topCenter);

glm::vec3 stickerNormal(const Piece& piece, const glm::vec3& localAxis);

// Color of the piece's sticker facing direction, if one is within tolerance
std::optional<Face> stickerFacing(const Piece& piece, const glm::vec3& direction);

}
