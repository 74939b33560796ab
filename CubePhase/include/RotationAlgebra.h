#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "CubeTypes.h"

namespace RotationAlgebra {

int axisIndex(Axis axis);
glm::vec3 axisVector(Axis axis);

// Quarter-turn count reduced to 0..3
int normalizeTurns(int turns);

// Rotates a lattice position about the cube center by turns * 90 degrees
glm::ivec3 rotatePosition(const glm::ivec3& position, Axis axis, int turns);

glm::quat moveRotation(Axis axis, int turns);

// q and -q describe the same rotation
bool sameRotation(const glm::quat& a, const glm::quat& b);

}
