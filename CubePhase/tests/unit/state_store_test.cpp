// Cube state store: lattice closure, move inverses, facelets, scramble and undo.

#include <algorithm>
#include <iostream>
#include <random>
#include <set>
#include <sstream>
#include <tuple>

#include "CubeStateMachine.h"
#include "Notation.h"
#include "RotationAlgebra.h"
#include "test_helpers.h"

static bool allHome(const CubeSnapshot& pieces) {
    for (const auto& piece : pieces) {
        if (piece.position != piece.origin) return false;
        if (!RotationAlgebra::sameRotation(piece.orientation, glm::quat(1.0f, 0.0f, 0.0f, 0.0f))) return false;
    }
    return true;
}

static bool onLattice(const CubeSnapshot& pieces) {
    std::set<std::tuple<int, int, int>> seen;
    for (const auto& piece : pieces) {
        const glm::ivec3& p = piece.position;
        for (int i = 0; i < 3; ++i) {
            if (p[i] < -1 || p[i] > 1) return false;
        }
        seen.insert(std::make_tuple(p.x, p.y, p.z));
    }
    return seen.size() == 27;
}

void testInitialPieces() {
    std::cout << "\n=== Test: Initial Pieces ===\n";
    const int failuresBefore = failureCount();

    CubeSnapshot pieces = initialPieces();
    check(pieces.size() == 27, "27 pieces");

    bool idsInOrder = true;
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (pieces[i].id != static_cast<int>(i)) idsInOrder = false;
    }
    check(idsInOrder, "ids 0..26 in index order");
    check(allHome(pieces), "every piece at its origin with identity orientation");
    check(pieces[0].origin == glm::ivec3(-1, -1, -1), "first piece is the (-1,-1,-1) corner");
    check(pieces[26].origin == glm::ivec3(1, 1, 1), "last piece is the (1,1,1) corner");

    reportSection("Initial pieces", failuresBefore);
}

void testRotationAlgebra() {
    std::cout << "\n=== Test: Rotation Algebra ===\n";
    const int failuresBefore = failureCount();

    check(RotationAlgebra::normalizeTurns(-1) == 3, "-1 turns normalizes to 3");
    check(RotationAlgebra::normalizeTurns(5) == 1, "5 turns normalizes to 1");
    check(RotationAlgebra::normalizeTurns(-2) == 2, "-2 turns normalizes to 2");

    const glm::ivec3 p(1, 1, 0);
    check(RotationAlgebra::rotatePosition(p, Axis::Y, 1) == glm::ivec3(0, 1, -1), "+90 about y takes +x to -z");
    check(RotationAlgebra::rotatePosition(p, Axis::Y, -1) == glm::ivec3(0, 1, 1), "-90 about y takes +x to +z");
    check(RotationAlgebra::rotatePosition(p, Axis::Y, 2) == glm::ivec3(-1, 1, 0), "half turn about y");
    check(RotationAlgebra::rotatePosition(glm::ivec3(0, 0, 1), Axis::X, -1) == glm::ivec3(0, 1, 0),
          "-90 about x takes front to up");

    bool fourQuarters = true;
    for (int a = 0; a < 3; ++a) {
        const Axis axis = static_cast<Axis>(a);
        glm::ivec3 q(1, -1, 1);
        for (int i = 0; i < 4; ++i) q = RotationAlgebra::rotatePosition(q, axis, 1);
        if (q != glm::ivec3(1, -1, 1)) fourQuarters = false;
    }
    check(fourQuarters, "four quarter turns return every position");

    // Integer rotation must agree with the quaternion for every turn count
    bool agrees = true;
    for (int a = 0; a < 3; ++a) {
        const Axis axis = static_cast<Axis>(a);
        for (int turns = -2; turns <= 2; ++turns) {
            const glm::vec3 rotated = RotationAlgebra::moveRotation(axis, turns) * glm::vec3(1.0f, -1.0f, 1.0f);
            const glm::vec3 expected(RotationAlgebra::rotatePosition(glm::ivec3(1, -1, 1), axis, turns));
            if (glm::distance(rotated, expected) > 1e-4f) agrees = false;
        }
    }
    check(agrees, "rotatePosition matches moveRotation");

    const glm::quat q = RotationAlgebra::moveRotation(Axis::Z, 1);
    check(RotationAlgebra::sameRotation(q, -q), "q and -q are the same rotation");
    check(!RotationAlgebra::sameRotation(q, RotationAlgebra::moveRotation(Axis::Z, -1)),
          "opposite quarter turns differ");

    reportSection("Rotation algebra", failuresBefore);
}

void testMoveInverses() {
    std::cout << "\n=== Test: Move Inverses ===\n";
    const int failuresBefore = failureCount();

    const char* tokens[] = {"R", "L", "U", "D", "F", "B", "M", "E", "S", "r", "x"};
    for (const char* token : tokens) {
        std::optional<Move> move = Notation::notationToMove(token);
        if (!move) {
            check(false, std::string(token) + " parses");
            continue;
        }

        CubeSnapshot pieces = applyMove(initialPieces(), *move);
        pieces = applyMove(pieces, Notation::invertMove(*move));
        check(allHome(pieces), std::string(token) + " then inverse = identity");

        CubeSnapshot fourTimes = initialPieces();
        for (int i = 0; i < 4; ++i) fourTimes = applyMove(fourTimes, *move);
        check(allHome(fourTimes), std::string(token) + " four times = identity");
    }

    reportSection("All move inverses", failuresBefore);
}

void testApplyMove() {
    std::cout << "\n=== Test: Apply Move ===\n";
    const int failuresBefore = failureCount();

    const CubeSnapshot solved = initialPieces();
    const Move r = *Notation::notationToMove("R");
    CubeSnapshot turned = applyMove(solved, r);

    check(allHome(solved), "input snapshot left untouched");
    check(onLattice(turned), "positions stay a permutation of the lattice");

    int moved = 0;
    for (size_t i = 0; i < turned.size(); ++i) {
        if (turned[i].position != solved[i].position) ++moved;
        if (turned[i].id != solved[i].id) moved = -100;
    }
    check(moved == 8, "R moves 8 pieces and keeps ids in place");

    check(isInSlice(solved[26], r), "(1,1,1) is in the R slice");
    check(!isInSlice(solved[0], r), "(-1,-1,-1) is not in the R slice");

    // The front-bottom-right corner goes up to the front-top-right slot
    const Piece& corner = pieceWithOrigin(turned, glm::ivec3(1, -1, 1));
    check(corner.position == glm::ivec3(1, 1, 1), "R takes DFR to UFR");

    std::mt19937 rng(7);
    std::vector<Move> moves;
    std::uniform_int_distribution<int> pick(0, 2);
    for (int i = 0; i < 60; ++i) {
        Move m;
        m.axis = static_cast<Axis>(pick(rng));
        m.slices = {pick(rng) - 1};
        m.turns = pick(rng) == 0 ? 2 : (pick(rng) == 0 ? 1 : -1);
        moves.push_back(m);
    }
    const CubeSnapshot mixed = applyMoves(solved, moves);
    check(onLattice(mixed), "60 random moves keep the lattice closed");
    check(allHome(applyMoves(mixed, Notation::invertAlgorithm(moves))), "inverse sequence restores the cube");

    reportSection("Apply move", failuresBefore);
}

void testFacelets() {
    std::cout << "\n=== Test: Facelets ===\n";
    const int failuresBefore = failureCount();

    CubeStateMachine machine;
    FaceletState solved = machine.getFacelets();
    bool uniform = true;
    for (int f = 0; f < 6; ++f) {
        for (int i = 0; i < 9; ++i) {
            if (solved[f * 9 + i] != f) uniform = false;
        }
    }
    check(uniform, "solved facelets are one color per face");
    check(machine.isFaceletSolved(), "solved cube reports facelet-solved");

    machine.applyMove(*Notation::notationToMove("R"));
    FaceletState state = machine.getFacelets();
    const int up = static_cast<int>(Face::U) * 9;
    const int green = static_cast<int>(Face::F);
    check(state[up + 2] == green && state[up + 5] == green && state[up + 8] == green,
          "R brings front stickers into the right column of U");
    check(state[up + 0] == static_cast<int>(Face::U), "left column of U untouched");
    check(std::count(state.begin(), state.end(), -1) == 0, "every facelet is filled");
    check(!machine.isFaceletSolved(), "R breaks facelet-solved");

    machine.reset();
    machine.applyMove(*Notation::notationToMove("x"));
    check(machine.isFaceletSolved(), "whole-cube rotation stays facelet-solved");

    machine.printState();
    reportSection("Facelets", failuresBefore);
}

void testStateMachine() {
    std::cout << "\n=== Test: State Machine ===\n";
    const int failuresBefore = failureCount();

    CubeStateMachine machine;
    std::shared_ptr<const CubeSnapshot> before = machine.getSnapshot();

    machine.applyMove(*Notation::notationToMove("U"));
    check(machine.getMoveCount() == 1, "move count increments");
    check(allHome(*before), "earlier snapshot is unchanged by later moves");
    check(machine.getSnapshot() != before, "a move installs a new snapshot");

    check(machine.findPieceAtPosition(glm::ivec3(0, -1, 0)) == 10, "D center found at its slot");
    const int idx = machine.findPieceAtPosition(glm::ivec3(1, 1, 1));
    check(idx >= 0 && machine.getPieces()[idx].position == glm::ivec3(1, 1, 1), "lookup returns the occupant");
    check(machine.getPieces()[idx].origin != glm::ivec3(1, 1, 1), "U moved a different corner into UFR");
    check(machine.findPieceAtPosition(glm::ivec3(2, 0, 0)) == -1, "position outside the cube gives -1");

    machine.reset();
    check(machine.getMoveCount() == 0, "reset clears the move count");
    check(allHome(machine.getPieces()), "reset restores the solved state");

    reportSection("State machine", failuresBefore);
}

void testScramble() {
    std::cout << "\n=== Test: Scramble and Undo ===\n";
    const int failuresBefore = failureCount();

    std::mt19937 rng(2024);
    CubeStateMachine machine;
    std::vector<Move> moves = machine.scramble(rng);

    check(moves.size() == static_cast<size_t>(SCRAMBLE_LENGTH), "default scramble length");
    check(machine.getMoveCount() == moves.size(), "scramble counts its moves");

    bool wellFormed = true;
    for (const auto& move : moves) {
        if (move.slices.size() != 1 || move.slices[0] < -1 || move.slices[0] > 1) wellFormed = false;
        if (move.turns != 1 && move.turns != -1 && move.turns != 2) wellFormed = false;
    }
    check(wellFormed, "single-slice moves with 1, -1 or 2 turns");
    check(onLattice(machine.getPieces()), "scrambled cube stays on the lattice");

    machine.applyMoves(Notation::invertAlgorithm(moves));
    check(machine.isFaceletSolved(), "undoing the scramble solves the facelets");
    bool positionsHome = true;
    for (const auto& piece : machine.getPieces()) {
        if (piece.position != piece.origin) positionsHome = false;
    }
    check(positionsHome, "undoing the scramble restores every position");

    CubeStateMachine empty;
    check(empty.scramble(rng, 0).empty(), "zero-length scramble applies nothing");
    check(empty.getMoveCount() == 0, "zero-length scramble leaves the count alone");

    reportSection("Scramble and undo", failuresBefore);
}

void testSectionReport() {
    std::cout << "\n=== Test: Section Report ===\n";
    const int failuresBefore = failureCount();

    std::ostringstream clean;
    reportSection("clean section", failureCount(), clean);
    check(clean.str() == "PASSED: clean section\n", "no new failures reads as passed");

    // Pretend one check failed since the section began
    std::ostringstream broken;
    reportSection("broken section", failureCount() - 1, broken);
    check(broken.str() == "FAILED: broken section (1 checks)\n", "a failed check reads as failed");

    reportSection("Section report", failuresBefore);
}

int main() {
    std::cout << "=================================\n";
    std::cout << "Cube State Store Tests\n";
    std::cout << "=================================\n";

    testInitialPieces();
    testRotationAlgebra();
    testMoveInverses();
    testApplyMove();
    testFacelets();
    testStateMachine();
    testScramble();
    testSectionReport();

    return finishTests("Cube state store");
}
