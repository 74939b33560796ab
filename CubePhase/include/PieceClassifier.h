#pragma once

#include <optional>
#include <vector>

#include "CubeTypes.h"

// Structural queries keyed on a piece's origin; current position never
// affects the answer.
namespace PieceClassifier {

PieceKind kindOf(const Piece& piece);
bool isCenter(const Piece& piece);
bool isEdge(const Piece& piece);
bool isCorner(const Piece& piece);

std::vector<Piece> centers(const CubeSnapshot& pieces);
std::vector<Piece> edges(const CubeSnapshot& pieces);
std::vector<Piece> corners(const CubeSnapshot& pieces);

// Index of the single non-zero origin component of a center
int baseAxisIndex(const Piece& center);
Face originFace(const Piece& center);

std::optional<Piece> findByOrigin(const CubeSnapshot& pieces, const glm::ivec3& origin);
std::optional<Piece> findById(const CubeSnapshot& pieces, int id);

// Edges whose origin touches the center (the cross of that face)
std::vector<Piece> crossEdges(const CubeSnapshot& pieces, const Piece& center);
// Corners on the same layer as the center
std::vector<Piece> layerCorners(const CubeSnapshot& pieces, const Piece& center);
// Middle-layer edge forming an F2L pair with a base corner
std::optional<Piece> pairedEdge(const CubeSnapshot& pieces, const Piece& corner, int baseAxis);
std::optional<Piece> oppositeCenter(const CubeSnapshot& pieces, const Piece& center);
// Edges then corners sharing the center's layer
std::vector<Piece> layerPieces(const CubeSnapshot& pieces, const Piece& center);

}
