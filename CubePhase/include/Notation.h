#pragma once

#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "CubeTypes.h"

// Singmaster notation. Face letters are resolved against a camera so that
// "F" always turns the face pointing at the viewer.
//   U D L R F B   outer layer
//   u d l r f b   outer layer plus middle slice
//   M E S         middle slice, turning like L, D, F
//   x y z         whole cube, turning like R, U, F
// Suffix "'" reverses, "2" doubles.
namespace Notation {

// cameraWorld columns 0/1/2 are the camera's right/up/back axes
std::optional<Move> notationToMove(const std::string& token, const glm::mat4& cameraWorld = glm::mat4(1.0f));

// Throws std::runtime_error on the first unrecognised token
std::vector<Move> parseAlgorithm(const std::string& text, const glm::mat4& cameraWorld = glm::mat4(1.0f));

Move invertMove(const Move& move);
std::vector<Move> invertAlgorithm(const std::vector<Move>& moves);

// Token for a move seen from the default camera; empty for moves with no token
std::optional<std::string> toNotation(const Move& move);
std::string algorithmToString(const std::vector<Move>& moves);

}
