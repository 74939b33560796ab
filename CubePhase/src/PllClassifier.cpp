#include "PllClassifier.h"
#include "CubeConstants.h"
#include "PieceClassifier.h"
#include "PlacementOracle.h"

#include <algorithm>
#include <cmath>
#include <set>

const char* pllCaseName(PllCase pllCase) {
    switch (pllCase) {
        case PllCase::Diagonal:   return "Diagonal";
        case PllCase::Headlights: return "Headlights";
        case PllCase::H:          return "PLL (H)";
        case PllCase::Z:          return "PLL (Z)";
        case PllCase::Ua:         return "PLL (Ua)";
        case PllCase::Ub:         return "PLL (Ub)";
        case PllCase::Auf:        return "PLL (AUF)";
        case PllCase::Solved:     return "Solved";
        case PllCase::Unknown:    return "Unknown";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, PllCase pllCase) {
    return os << pllCaseName(pllCase);
}

namespace PllClassifier {

std::vector<SideView> readSides(const std::vector<Piece>& topPieces, const Piece& topCenter) {
    const glm::vec3 up = PlacementOracle::upDirection(topCenter);
    const glm::vec3 centerPos(topCenter.position);

    std::vector<Piece> corners;
    std::vector<Piece> edges;
    for (const auto& piece : topPieces) {
        if (PieceClassifier::isCorner(piece)) corners.push_back(piece);
        else if (PieceClassifier::isEdge(piece)) edges.push_back(piece);
    }

    auto facesSide = [&](const Piece& piece, const glm::vec3& dir) {
        return glm::dot(glm::vec3(piece.position) - centerPos, dir) > SIDE_MEMBER_DOT;
    };

    std::vector<SideView> sides;
    for (const auto& candidate : kFaceDirections) {
        const glm::vec3 dir(candidate);
        if (std::abs(glm::dot(dir, up)) >= SIDE_PERPENDICULAR_DOT) continue;

        SideView side;
        side.dir = dir;

        std::vector<Piece> sideCorners;
        for (const auto& corner : corners) {
            if (facesSide(corner, dir)) sideCorners.push_back(corner);
        }
        if (sideCorners.size() == 2) {
            side.corner1 = PlacementOracle::stickerFacing(sideCorners[0], dir);
            side.corner2 = PlacementOracle::stickerFacing(sideCorners[1], dir);
        }
        for (const auto& edge : edges) {
            if (facesSide(edge, dir)) {
                side.edge = PlacementOracle::stickerFacing(edge, dir);
                break;
            }
        }

        side.headlights = side.corner1 && side.corner2 && *side.corner1 == *side.corner2;
        side.bar = side.headlights && side.edge && *side.edge == *side.corner1;
        sides.push_back(side);
    }
    return sides;
}

PllCase identify(const std::vector<Piece>& topPieces, const Piece& topCenter) {
    const glm::vec3 up = PlacementOracle::upDirection(topCenter);
    const std::vector<SideView> sides = readSides(topPieces, topCenter);

    const auto headlightsCount = std::count_if(sides.begin(), sides.end(),
                                               [](const SideView& s) { return s.headlights; });
    const auto barCount = std::count_if(sides.begin(), sides.end(),
                                        [](const SideView& s) { return s.bar; });

    if (headlightsCount == 0) return PllCase::Diagonal;
    if (headlightsCount == 1) return PllCase::Headlights;
    if (headlightsCount != 4) return PllCase::Unknown;

    if (barCount == 4) {
        // A solved layer shows four different side colors
        std::set<Face> colors;
        for (const auto& side : sides) colors.insert(*side.corner1);
        return colors.size() == 4 ? PllCase::Solved : PllCase::Unknown;
    }

    if (barCount == 0) {
        // H swaps opposite edges, Z adjacent ones
        for (const auto& side : sides) {
            if (side.corner1 && side.edge) {
                return oppositeFace(*side.corner1) == *side.edge ? PllCase::H : PllCase::Z;
            }
        }
        return PllCase::Z;
    }

    if (barCount == 1) {
        auto back = std::find_if(sides.begin(), sides.end(), [](const SideView& s) { return s.bar; });
        const glm::vec3 frontDir = -back->dir;
        const glm::vec3 rightDir = glm::cross(up, frontDir);

        auto alignedWith = [](const glm::vec3& target) {
            return [target](const SideView& s) { return glm::dot(s.dir, target) > 0.9f; };
        };
        auto front = std::find_if(sides.begin(), sides.end(), alignedWith(frontDir));
        auto right = std::find_if(sides.begin(), sides.end(), alignedWith(rightDir));

        if (front != sides.end() && right != sides.end() && front->edge && right->corner1) {
            return *front->edge == *right->corner1 ? PllCase::Ua : PllCase::Ub;
        }
        return PllCase::Ua;
    }

    return PllCase::Z;
}

}
