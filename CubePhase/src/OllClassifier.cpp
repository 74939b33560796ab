#include "OllClassifier.h"
#include "CubeConstants.h"
#include "PieceClassifier.h"
#include "PlacementOracle.h"

#include <limits>

const char* ollCaseName(OllCase ollCase) {
    switch (ollCase) {
        case OllCase::Dot:      return "Dot";
        case OllCase::LShape:   return "L-Shape";
        case OllCase::Line:     return "Line";
        case OllCase::Sune:     return "Sune";
        case OllCase::AntiSune: return "Anti-Sune";
        case OllCase::H:        return "H";
        case OllCase::Pi:       return "Pi";
        case OllCase::U:        return "U";
        case OllCase::T:        return "T";
        case OllCase::L:        return "L";
        case OllCase::Unknown:  return "Unknown";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, OllCase ollCase) {
    return os << ollCaseName(ollCase);
}

namespace OllClassifier {
namespace {
float positionDistance(const Piece& a, const Piece& b) {
    return glm::distance(glm::vec3(a.position), glm::vec3(b.position));
}

// Where the top-color sticker of a piece currently points
glm::vec3 topStickerNormal(const Piece& piece, const Piece& topCenter) {
    const glm::vec3 localUp = glm::normalize(glm::vec3(topCenter.origin));
    return PlacementOracle::stickerNormal(piece, localUp);
}

OllCase classifyNoCorners(const std::vector<Piece>& corners, const Piece& topCenter) {
    int headlightPairs = 0;
    for (size_t i = 0; i < corners.size(); ++i) {
        for (size_t j = i + 1; j < corners.size(); ++j) {
            if (positionDistance(corners[i], corners[j]) > CORNER_ADJACENT_DISTANCE) continue;

            const glm::vec3 n1 = topStickerNormal(corners[i], topCenter);
            const glm::vec3 n2 = topStickerNormal(corners[j], topCenter);
            if (glm::dot(n1, n2) > HEADLIGHT_NORMAL_DOT) {
                ++headlightPairs;
            }
        }
    }

    // H shows headlights on two opposite sides, Pi on one
    if (headlightPairs >= 2) return OllCase::H;
    if (headlightPairs == 1) return OllCase::Pi;
    return OllCase::Unknown;
}

OllCase classifyOneCorner(const std::vector<Piece>& corners, const Piece& oriented,
                          const Piece& topCenter, const glm::vec3& up) {
    const glm::vec3 centerPos(topCenter.position);
    const glm::vec3 orientedRel = glm::vec3(oriented.position) - centerPos;
    const glm::vec3 tangent = glm::normalize(glm::cross(up, orientedRel));

    const Piece* neighbor = nullptr;
    float maxDot = -std::numeric_limits<float>::infinity();
    for (const auto& corner : corners) {
        if (corner.id == oriented.id) continue;
        const glm::vec3 rel = glm::normalize(glm::vec3(corner.position) - centerPos);
        const float dot = glm::dot(rel, tangent);
        if (dot > maxDot) {
            maxDot = dot;
            neighbor = &corner;
        }
    }
    if (!neighbor) return OllCase::Unknown;

    // Sign of (radial x sticker) . up gives the twist direction
    const glm::vec3 neighborRel = glm::vec3(neighbor->position) - centerPos;
    const glm::vec3 sticker = topStickerNormal(*neighbor, topCenter);
    const float twist = glm::dot(glm::cross(neighborRel, sticker), up);
    return twist > 0.0f ? OllCase::Sune : OllCase::AntiSune;
}

OllCase classifyTwoCorners(const std::vector<Piece>& corners,
                           const std::vector<Piece>& oriented,
                           const Piece& topCenter) {
    if (positionDistance(oriented[0], oriented[1]) > CORNER_ADJACENT_DISTANCE) return OllCase::L;

    std::vector<Piece> unoriented;
    for (const auto& corner : corners) {
        if (corner.id != oriented[0].id && corner.id != oriented[1].id) {
            unoriented.push_back(corner);
        }
    }
    if (unoriented.size() != 2) return OllCase::Unknown;

    const glm::vec3 n1 = topStickerNormal(unoriented[0], topCenter);
    const glm::vec3 n2 = topStickerNormal(unoriented[1], topCenter);
    // Parallel stickers are headlights (U); otherwise they point apart (T)
    return glm::dot(n1, n2) > UNORIENTED_PAIR_DOT ? OllCase::U : OllCase::T;
}
} // namespace

OllCase identify(const std::vector<Piece>& topPieces, const Piece& topCenter) {
    const glm::vec3 up = PlacementOracle::upDirection(topCenter);

    std::vector<Piece> edges;
    std::vector<Piece> corners;
    for (const auto& piece : topPieces) {
        if (PieceClassifier::isEdge(piece)) edges.push_back(piece);
        else if (PieceClassifier::isCorner(piece)) corners.push_back(piece);
    }

    std::vector<Piece> orientedEdges;
    for (const auto& edge : edges) {
        if (PlacementOracle::isOrientedForTopLayer(edge, topCenter)) orientedEdges.push_back(edge);
    }

    if (orientedEdges.size() < 4) {
        if (orientedEdges.empty()) return OllCase::Dot;
        if (orientedEdges.size() == 2) {
            // Adjacent edges sit 1.41 apart, opposite ones 2.0
            return positionDistance(orientedEdges[0], orientedEdges[1]) < OLL_EDGE_ADJACENT_DISTANCE
                       ? OllCase::LShape
                       : OllCase::Line;
        }
        // Odd counts cannot happen on a legal cube
        return OllCase::Unknown;
    }

    std::vector<Piece> orientedCorners;
    for (const auto& corner : corners) {
        if (PlacementOracle::isOrientedForTopLayer(corner, topCenter)) orientedCorners.push_back(corner);
    }

    switch (orientedCorners.size()) {
        case 0: return classifyNoCorners(corners, topCenter);
        case 1: return classifyOneCorner(corners, orientedCorners[0], topCenter, up);
        case 2: return classifyTwoCorners(corners, orientedCorners, topCenter);
        default: return OllCase::Unknown;
    }
}

}
