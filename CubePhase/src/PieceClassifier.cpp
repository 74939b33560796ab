#include "PieceClassifier.h"
#include "CubeConstants.h"

#include <cstdlib>

namespace PieceClassifier {
namespace {
int originWeight(const Piece& piece) {
    return std::abs(piece.origin.x) + std::abs(piece.origin.y) + std::abs(piece.origin.z);
}

template <typename Pred>
std::vector<Piece> selectPieces(const CubeSnapshot& pieces, Pred pred) {
    std::vector<Piece> out;
    for (const auto& piece : pieces) {
        if (pred(piece)) out.push_back(piece);
    }
    return out;
}
} // namespace

PieceKind kindOf(const Piece& piece) {
    switch (originWeight(piece)) {
        case 1: return PieceKind::Center;
        case 2: return PieceKind::Edge;
        case 3: return PieceKind::Corner;
        default: return PieceKind::Core;
    }
}

bool isCenter(const Piece& piece) { return kindOf(piece) == PieceKind::Center; }
bool isEdge(const Piece& piece) { return kindOf(piece) == PieceKind::Edge; }
bool isCorner(const Piece& piece) { return kindOf(piece) == PieceKind::Corner; }

std::vector<Piece> centers(const CubeSnapshot& pieces) { return selectPieces(pieces, isCenter); }
std::vector<Piece> edges(const CubeSnapshot& pieces) { return selectPieces(pieces, isEdge); }
std::vector<Piece> corners(const CubeSnapshot& pieces) { return selectPieces(pieces, isCorner); }

int baseAxisIndex(const Piece& center) {
    if (center.origin.x != 0) return 0;
    if (center.origin.y != 0) return 1;
    return 2;
}

Face originFace(const Piece& center) {
    return directionToFace(glm::vec3(center.origin));
}

std::optional<Piece> findByOrigin(const CubeSnapshot& pieces, const glm::ivec3& origin) {
    for (const auto& piece : pieces) {
        if (piece.origin == origin) return piece;
    }
    return std::nullopt;
}

std::optional<Piece> findById(const CubeSnapshot& pieces, int id) {
    for (const auto& piece : pieces) {
        if (piece.id == id) return piece;
    }
    return std::nullopt;
}

std::vector<Piece> crossEdges(const CubeSnapshot& pieces, const Piece& center) {
    const glm::vec3 c(center.origin);
    return selectPieces(pieces, [&](const Piece& p) {
        return isEdge(p) && glm::distance(c, glm::vec3(p.origin)) < CROSS_EDGE_DISTANCE;
    });
}

std::vector<Piece> layerCorners(const CubeSnapshot& pieces, const Piece& center) {
    const int axis = baseAxisIndex(center);
    return selectPieces(pieces, [&](const Piece& p) {
        return isCorner(p) && p.origin[axis] == center.origin[axis];
    });
}

std::optional<Piece> pairedEdge(const CubeSnapshot& pieces, const Piece& corner, int baseAxis) {
    glm::ivec3 edgeOrigin = corner.origin;
    edgeOrigin[baseAxis] = 0;
    std::optional<Piece> edge = findByOrigin(pieces, edgeOrigin);
    if (edge && !isEdge(*edge)) return std::nullopt;
    return edge;
}

std::optional<Piece> oppositeCenter(const CubeSnapshot& pieces, const Piece& center) {
    const glm::vec3 base(center.origin);
    for (const auto& piece : pieces) {
        if (isCenter(piece) && glm::dot(base, glm::vec3(piece.origin)) < OPPOSITE_FACE_DOT) {
            return piece;
        }
    }
    return std::nullopt;
}

std::vector<Piece> layerPieces(const CubeSnapshot& pieces, const Piece& center) {
    const int axis = baseAxisIndex(center);
    auto inLayer = [&](const Piece& p) { return p.origin[axis] == center.origin[axis]; };

    std::vector<Piece> out = selectPieces(pieces, [&](const Piece& p) { return isEdge(p) && inLayer(p); });
    for (const auto& corner : layerCorners(pieces, center)) {
        out.push_back(corner);
    }
    return out;
}

}
