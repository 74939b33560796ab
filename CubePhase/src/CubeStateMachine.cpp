#include "CubeStateMachine.h"
#include "Notation.h"
#include "PlacementOracle.h"
#include "RotationAlgebra.h"

#include <algorithm>
#include <iostream>
#include <optional>
#include <utility>

CubeSnapshot initialPieces() {
    CubeSnapshot pieces;
    pieces.reserve(27);
    int id = 0;
    for (int x = -1; x <= 1; ++x) {
        for (int y = -1; y <= 1; ++y) {
            for (int z = -1; z <= 1; ++z) {
                Piece piece;
                piece.id = id++;
                piece.origin = glm::ivec3(x, y, z);
                piece.position = piece.origin;
                pieces.push_back(piece);
            }
        }
    }
    return pieces;
}

bool isInSlice(const Piece& piece, const Move& move) {
    const int layer = piece.position[RotationAlgebra::axisIndex(move.axis)];
    return std::find(move.slices.begin(), move.slices.end(), layer) != move.slices.end();
}

CubeSnapshot applyMove(const CubeSnapshot& pieces, const Move& move) {
    const glm::quat rotation = RotationAlgebra::moveRotation(move.axis, move.turns);

    CubeSnapshot next;
    next.reserve(pieces.size());
    for (const auto& piece : pieces) {
        if (!isInSlice(piece, move)) {
            next.push_back(piece);
            continue;
        }
        Piece moved = piece;
        moved.position = RotationAlgebra::rotatePosition(piece.position, move.axis, move.turns);
        // World-space rotation: pre-multiply
        moved.orientation = glm::normalize(rotation * piece.orientation);
        next.push_back(moved);
    }
    return next;
}

CubeSnapshot applyMoves(const CubeSnapshot& pieces, const std::vector<Move>& moves) {
    CubeSnapshot current = pieces;
    for (const auto& move : moves) {
        current = applyMove(current, move);
    }
    return current;
}

namespace {
// Row/column of a sticker in the flat net of a face
std::pair<int, int> faceletCell(Face face, const glm::ivec3& p) {
    switch (face) {
        case Face::R: return {1 - p.y, 1 - p.z};
        case Face::L: return {1 - p.y, p.z + 1};
        case Face::U: return {p.z + 1, p.x + 1};
        case Face::D: return {1 - p.z, p.x + 1};
        case Face::F: return {1 - p.y, p.x + 1};
        case Face::B: return {1 - p.y, 1 - p.x};
    }
    return {0, 0};
}
}

FaceletState buildFacelets(const CubeSnapshot& pieces) {
    FaceletState state{};
    state.fill(-1);

    for (int f = 0; f < 6; ++f) {
        const Face face = static_cast<Face>(f);
        const glm::ivec3& dir = kFaceDirections[f];
        for (const auto& piece : pieces) {
            if (glm::dot(glm::vec3(piece.position), glm::vec3(dir)) < 0.5f) continue;

            std::optional<Face> color = PlacementOracle::stickerFacing(piece, faceDirection(face));
            if (!color) continue;

            auto cell = faceletCell(face, piece.position);
            state[f * 9 + cell.first * 3 + cell.second] = static_cast<int>(*color);
        }
    }
    return state;
}

CubeStateMachine::CubeStateMachine()
    : snapshot(std::make_shared<const CubeSnapshot>(initialPieces())) {}

void CubeStateMachine::applyMove(const Move& move) {
    snapshot = std::make_shared<const CubeSnapshot>(::applyMove(*snapshot, move));
    ++moveCount;
}

void CubeStateMachine::applyMoves(const std::vector<Move>& moves) {
    for (const auto& move : moves) {
        applyMove(move);
    }
}

void CubeStateMachine::reset() {
    snapshot = std::make_shared<const CubeSnapshot>(initialPieces());
    moveCount = 0;
}

std::vector<Move> CubeStateMachine::scramble(std::mt19937& rng, int count) {
    const Axis axes[3] = {Axis::X, Axis::Y, Axis::Z};
    const int slices[3] = {-1, 0, 1};
    const int turns[3] = {1, -1, 2};
    std::uniform_int_distribution<int> pick(0, 2);

    if (count < 0) {
        std::cerr << "[CubeStateMachine] Ignoring negative scramble length " << count << std::endl;
        count = 0;
    }

    std::vector<Move> moves;
    moves.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        Move move;
        move.axis = axes[pick(rng)];
        move.slices = {slices[pick(rng)]};
        move.turns = turns[pick(rng)];
        moves.push_back(move);
    }

    applyMoves(moves);
    std::cout << "[CubeStateMachine] Scrambled with " << moves.size() << " moves: "
              << Notation::algorithmToString(moves) << std::endl;
    return moves;
}

int CubeStateMachine::findPieceAtPosition(const glm::ivec3& position) const {
    const auto& pieces = *snapshot;
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (pieces[i].position == position) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool CubeStateMachine::isFaceletSolved() const {
    const FaceletState state = getFacelets();
    for (int face = 0; face < 6; ++face) {
        int centerColor = state[face * 9 + 4];
        for (int i = 0; i < 9; ++i) {
            if (state[face * 9 + i] != centerColor) {
                return false;
            }
        }
    }
    return true;
}

void CubeStateMachine::printState() const {
    const char* faceNames[] = {"Right", "Left", "Up", "Down", "Front", "Back"};
    const char* colorNames[] = {"R", "O", "W", "Y", "G", "B"};
    const FaceletState state = getFacelets();

    std::cout << "\n=== Cube State (" << moveCount << " moves) ===" << std::endl;
    for (int face = 0; face < 6; ++face) {
        std::cout << faceNames[face] << ":" << std::endl;
        for (int row = 0; row < 3; ++row) {
            std::cout << "  ";
            for (int col = 0; col < 3; ++col) {
                int colorIdx = state[face * 9 + row * 3 + col];
                if (colorIdx >= 0 && colorIdx < 6) {
                    std::cout << colorNames[colorIdx] << " ";
                } else {
                    std::cout << "? ";
                }
            }
            std::cout << std::endl;
        }
    }
    std::cout << "Solved: " << (isFaceletSolved() ? "YES" : "NO") << std::endl;
    std::cout << "===============================\n" << std::endl;
}
