#include "PlacementOracle.h"
#include "CubeConstants.h"

#include <algorithm>
#include <cmath>

namespace PlacementOracle {

bool isCorrectlyPlaced(const Piece& piece, const Piece& referenceCenter) {
    const glm::vec3 initial = glm::vec3(referenceCenter.origin - piece.origin);
    const glm::vec3 current = glm::vec3(referenceCenter.position - piece.position);

    const glm::vec3 local = glm::inverse(glm::normalize(piece.orientation)) * current;
    return glm::distance(local, initial) < PLACEMENT_TOLERANCE;
}

bool isSeated(const Piece& piece, const std::vector<Piece>& centers) {
    for (const auto& center : centers) {
        const glm::ivec3 shared = center.origin * piece.origin;
        const bool touching = (shared.x + shared.y + shared.z) > 0;
        if (touching && !isCorrectlyPlaced(piece, center)) return false;
    }
    return true;
}

glm::vec3 upDirection(const Piece& topCenter) {
    const glm::vec3 localUp = glm::normalize(glm::vec3(topCenter.origin));
    return glm::normalize(topCenter.orientation) * localUp;
}

bool isOrientedForTopLayer(const Piece& piece, const Piece& topCenter) {
    const glm::vec3 localUp = glm::normalize(glm::vec3(topCenter.origin));
    const glm::vec3 centerUp = upDirection(topCenter);
    const glm::vec3 pieceUp = glm::normalize(piece.orientation) * localUp;

    const float cosAngle = std::clamp(glm::dot(centerUp, pieceUp), -1.0f, 1.0f);
    return std::acos(cosAngle) < ORIENTATION_TOLERANCE;
}

glm::vec3 stickerNormal(const Piece& piece, const glm::vec3& localAxis) {
    return glm::normalize(piece.orientation) * localAxis;
}

std::optional<Face> stickerFacing(const Piece& piece, const glm::vec3& direction) {
    std::optional<Face> best;
    float maxDot = STICKER_FACING_DOT;

    for (int f = 0; f < static_cast<int>(kFaceDirections.size()); ++f) {
        const glm::ivec3& n = kFaceDirections[f];
        // Only faces the piece physically carries a sticker on
        const int axis = (n.x != 0) ? 0 : (n.y != 0) ? 1 : 2;
        if (piece.origin[axis] != n[axis]) continue;

        const float dot = glm::dot(stickerNormal(piece, glm::vec3(n)), direction);
        if (dot > maxDot) {
            maxDot = dot;
            best = static_cast<Face>(f);
        }
    }
    return best;
}

}
