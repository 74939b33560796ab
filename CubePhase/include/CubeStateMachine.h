#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <random>
#include <vector>

#include <glm/glm.hpp>

#include "CubeConstants.h"
#include "CubeTypes.h"

// Sticker colors: 54 entries, faces ordered Right/Left/Up/Down/Front/Back,
// row-major per face, values are Face indices (-1 where nothing faces out)
using FaceletState = std::array<int, 54>;

CubeSnapshot initialPieces();
bool isInSlice(const Piece& piece, const Move& move);
CubeSnapshot applyMove(const CubeSnapshot& pieces, const Move& move);
CubeSnapshot applyMoves(const CubeSnapshot& pieces, const std::vector<Move>& moves);
FaceletState buildFacelets(const CubeSnapshot& pieces);

class CubeStateMachine {
public:
    CubeStateMachine();

    // Snapshots are immutable; a move installs a new one
    std::shared_ptr<const CubeSnapshot> getSnapshot() const { return snapshot; }
    const CubeSnapshot& getPieces() const { return *snapshot; }
    std::size_t getMoveCount() const { return moveCount; }

    void applyMove(const Move& move);
    void applyMoves(const std::vector<Move>& moves);
    void reset();

    // Random single-layer turns; returns what was applied
    std::vector<Move> scramble(std::mt19937& rng, int moveCount = SCRAMBLE_LENGTH);

    int findPieceAtPosition(const glm::ivec3& position) const;

    FaceletState getFacelets() const { return buildFacelets(*snapshot); }
    bool isFaceletSolved() const;
    void printState() const;

private:
    std::shared_ptr<const CubeSnapshot> snapshot;
    std::size_t moveCount{0};
};
