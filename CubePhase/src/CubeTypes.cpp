#include "CubeTypes.h"

#include <cmath>

const std::array<glm::ivec3, 6> kFaceDirections = {
    glm::ivec3(1, 0, 0),   // Right
    glm::ivec3(-1, 0, 0),  // Left
    glm::ivec3(0, 1, 0),   // Up
    glm::ivec3(0, -1, 0),  // Down
    glm::ivec3(0, 0, 1),   // Front
    glm::ivec3(0, 0, -1)   // Back
};

namespace {
const char kFaceLetters[6] = {'R', 'L', 'U', 'D', 'F', 'B'};
const char* const kColorNames[6] = {"Red", "Orange", "White", "Yellow", "Green", "Blue"};
const char* const kColorHex[6] = {"#b71234", "#ff5800", "#ffffff", "#ffd500", "#009b48", "#0046ad"};
}

glm::vec3 faceDirection(Face face) {
    return glm::vec3(kFaceDirections[static_cast<int>(face)]);
}

char faceLetter(Face face) {
    return kFaceLetters[static_cast<int>(face)];
}

const char* faceColorName(Face face) {
    return kColorNames[static_cast<int>(face)];
}

const char* faceColorHex(Face face) {
    return kColorHex[static_cast<int>(face)];
}

Face oppositeFace(Face face) {
    // Faces come in +/- pairs
    return static_cast<Face>(static_cast<int>(face) ^ 1);
}

Face directionToFace(const glm::vec3& dir) {
    float bestDot = -2.0f;
    int bestIdx = 0;
    float len = glm::length(dir);
    glm::vec3 normalized = len > 0.0f ? (dir / len) : glm::vec3(0.0f);
    for (int i = 0; i < static_cast<int>(kFaceDirections.size()); ++i) {
        float dot = glm::dot(normalized, glm::vec3(kFaceDirections[i]));
        if (dot > bestDot) {
            bestDot = dot;
            bestIdx = i;
        }
    }
    return static_cast<Face>(bestIdx);
}
