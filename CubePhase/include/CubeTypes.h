#pragma once

#include <array>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

enum class Axis : int { X = 0, Y = 1, Z = 2 };

// Faces ordered Right/Left/Up/Down/Front/Back, matching kFaceDirections
enum class Face : int { R = 0, L = 1, U = 2, D = 3, F = 4, B = 5 };

enum class PieceKind { Core, Center, Edge, Corner };

struct Piece {
    int id{-1};
    glm::ivec3 origin{0};    // Solved-state position, never changes
    glm::ivec3 position{0};  // Current lattice position
    glm::quat orientation{1.0f, 0.0f, 0.0f, 0.0f};
};

struct Move {
    Axis axis{Axis::X};
    std::vector<int> slices;  // Layer coordinates along axis
    int turns{0};             // Signed quarter turns, right-hand rule about +axis
};

using CubeSnapshot = std::vector<Piece>;

extern const std::array<glm::ivec3, 6> kFaceDirections;

glm::vec3 faceDirection(Face face);
char faceLetter(Face face);
const char* faceColorName(Face face);
const char* faceColorHex(Face face);
Face oppositeFace(Face face);
// Face whose outward direction is the dominant component of dir
Face directionToFace(const glm::vec3& dir);
