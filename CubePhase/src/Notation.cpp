#include "Notation.h"
#include "RotationAlgebra.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace Notation {
namespace {
struct GlobalAxis {
    Axis axis;
    int slice;
    glm::vec3 vec;
};

const GlobalAxis kGlobalAxes[6] = {
    {Axis::X, 1, glm::vec3(1.0f, 0.0f, 0.0f)},
    {Axis::X, -1, glm::vec3(-1.0f, 0.0f, 0.0f)},
    {Axis::Y, 1, glm::vec3(0.0f, 1.0f, 0.0f)},
    {Axis::Y, -1, glm::vec3(0.0f, -1.0f, 0.0f)},
    {Axis::Z, 1, glm::vec3(0.0f, 0.0f, 1.0f)},
    {Axis::Z, -1, glm::vec3(0.0f, 0.0f, -1.0f)},
};

// Outer face a token turns like
char referenceFace(char base) {
    switch (base) {
        case 'M': return 'L';
        case 'E': return 'D';
        case 'S': return 'F';
        case 'x': return 'R';
        case 'y': return 'U';
        case 'z': return 'F';
        default:  return static_cast<char>(std::toupper(static_cast<unsigned char>(base)));
    }
}

bool isKnownBase(char base) {
    static const std::string kBases = "UDLRFBudlrfbMESxyz";
    return kBases.find(base) != std::string::npos;
}
} // namespace

std::optional<Move> notationToMove(const std::string& token, const glm::mat4& cameraWorld) {
    if (token.empty() || !isKnownBase(token[0])) return std::nullopt;

    const char base = token[0];
    bool isPrime = false;
    bool isDouble = false;
    for (size_t i = 1; i < token.size(); ++i) {
        if (token[i] == '\'' && !isPrime) isPrime = true;
        else if (token[i] == '2' && !isDouble) isDouble = true;
        else return std::nullopt;
    }

    int dirMult = 1;
    if (isDouble) dirMult = 2;
    if (isPrime) dirMult = -dirMult;

    const glm::vec3 right = glm::normalize(glm::vec3(cameraWorld[0]));
    const glm::vec3 up = glm::normalize(glm::vec3(cameraWorld[1]));
    const glm::vec3 back = glm::normalize(glm::vec3(cameraWorld[2]));

    glm::vec3 target = back;
    switch (referenceFace(base)) {
        case 'F': target = back; break;
        case 'B': target = -back; break;
        case 'R': target = right; break;
        case 'L': target = -right; break;
        case 'U': target = up; break;
        case 'D': target = -up; break;
        default: break;
    }

    const GlobalAxis* best = &kGlobalAxes[0];
    float maxDot = -std::numeric_limits<float>::infinity();
    for (const auto& candidate : kGlobalAxes) {
        const float dot = glm::dot(candidate.vec, target);
        if (dot > maxDot) {
            maxDot = dot;
            best = &candidate;
        }
    }

    // Clockwise seen from the positive face is a negative angle, and the
    // other way round for the negative face
    const int baseDir = -best->slice;

    Move move;
    move.axis = best->axis;
    if (base == 'M' || base == 'E' || base == 'S') {
        move.slices = {0};
    } else if (base == 'x' || base == 'y' || base == 'z') {
        move.slices = {-1, 0, 1};
    } else if (std::islower(static_cast<unsigned char>(base))) {
        move.slices = {best->slice, 0};
    } else {
        move.slices = {best->slice};
    }
    move.turns = baseDir * dirMult;
    return move;
}

std::vector<Move> parseAlgorithm(const std::string& text, const glm::mat4& cameraWorld) {
    std::vector<Move> moves;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        std::optional<Move> move = notationToMove(token, cameraWorld);
        if (!move) {
            throw std::runtime_error("Unrecognized move token '" + token + "' in \"" + text + "\"");
        }
        moves.push_back(*move);
    }
    return moves;
}

Move invertMove(const Move& move) {
    Move inverse = move;
    inverse.turns = -move.turns;
    return inverse;
}

std::vector<Move> invertAlgorithm(const std::vector<Move>& moves) {
    std::vector<Move> out;
    out.reserve(moves.size());
    for (auto it = moves.rbegin(); it != moves.rend(); ++it) {
        out.push_back(invertMove(*it));
    }
    return out;
}

std::optional<std::string> toNotation(const Move& move) {
    std::vector<int> slices = move.slices;
    std::sort(slices.begin(), slices.end());
    slices.erase(std::unique(slices.begin(), slices.end()), slices.end());

    static const char kPositive[3] = {'R', 'U', 'F'};
    static const char kNegative[3] = {'L', 'D', 'B'};
    static const char kMiddle[3] = {'M', 'E', 'S'};
    static const char kWhole[3] = {'x', 'y', 'z'};
    // S turns like F; M and E turn like the negative faces
    static const int kMiddleReference[3] = {-1, -1, 1};

    const int a = RotationAlgebra::axisIndex(move.axis);
    char letter = '?';
    int reference = 0;

    if (slices == std::vector<int>{1}) {
        letter = kPositive[a];
        reference = 1;
    } else if (slices == std::vector<int>{-1}) {
        letter = kNegative[a];
        reference = -1;
    } else if (slices == std::vector<int>{0}) {
        letter = kMiddle[a];
        reference = kMiddleReference[a];
    } else if (slices == std::vector<int>{0, 1}) {
        letter = static_cast<char>(std::tolower(static_cast<unsigned char>(kPositive[a])));
        reference = 1;
    } else if (slices == std::vector<int>{-1, 0}) {
        letter = static_cast<char>(std::tolower(static_cast<unsigned char>(kNegative[a])));
        reference = -1;
    } else if (slices == std::vector<int>{-1, 0, 1}) {
        letter = kWhole[a];
        reference = 1;
    } else {
        return std::nullopt;
    }

    // Quarter turns in the token's own clockwise sense
    const int clockwise = RotationAlgebra::normalizeTurns(move.turns * -reference);
    switch (clockwise) {
        case 1: return std::string(1, letter);
        case 2: return std::string(1, letter) + "2";
        case 3: return std::string(1, letter) + "'";
        default: return std::nullopt;
    }
}

std::string algorithmToString(const std::vector<Move>& moves) {
    std::string out;
    for (const auto& move : moves) {
        if (!out.empty()) out += ' ';
        out += toNotation(move).value_or("?");
    }
    return out;
}

}
