#include "RotationAlgebra.h"
#include "CubeConstants.h"

#include <cmath>

namespace RotationAlgebra {

int axisIndex(Axis axis) {
    return static_cast<int>(axis);
}

glm::vec3 axisVector(Axis axis) {
    switch (axis) {
        case Axis::X: return glm::vec3(1.0f, 0.0f, 0.0f);
        case Axis::Y: return glm::vec3(0.0f, 1.0f, 0.0f);
        case Axis::Z: return glm::vec3(0.0f, 0.0f, 1.0f);
    }
    return glm::vec3(0.0f);
}

int normalizeTurns(int turns) {
    return ((turns % 4) + 4) % 4;
}

glm::ivec3 rotatePosition(const glm::ivec3& position, Axis axis, int turns) {
    const int x = position.x;
    const int y = position.y;
    const int z = position.z;

    const int quarter = normalizeTurns(turns);
    if (quarter == 0) return position;

    // Half turn: negate the two axes orthogonal to the rotation axis
    if (quarter == 2) {
        switch (axis) {
            case Axis::X: return glm::ivec3(x, -y, -z);
            case Axis::Y: return glm::ivec3(-x, y, -z);
            case Axis::Z: return glm::ivec3(-x, -y, z);
        }
    }

    // +90 for one quarter, -90 for three
    const int dir = (quarter == 1) ? 1 : -1;
    switch (axis) {
        case Axis::X: return glm::ivec3(x, -dir * z, dir * y);
        case Axis::Y: return glm::ivec3(dir * z, y, -dir * x);
        case Axis::Z: return glm::ivec3(-dir * y, dir * x, z);
    }
    return position;
}

glm::quat moveRotation(Axis axis, int turns) {
    const float angle = glm::radians(90.0f * static_cast<float>(turns));
    return glm::angleAxis(angle, axisVector(axis));
}

bool sameRotation(const glm::quat& a, const glm::quat& b) {
    return std::abs(glm::dot(a, b)) > 1.0f - QUAT_SAME_ROTATION_EPSILON;
}

}
