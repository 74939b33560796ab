#pragma once

#include <optional>
#include <string>

#include "OllClassifier.h"
#include "PllClassifier.h"

// Standard 2-look algorithms for every recognised case, in face-turn notation
namespace CaseAlgorithms {

std::optional<std::string> ollAlgorithm(OllCase ollCase);
std::optional<std::string> pllAlgorithm(PllCase pllCase);

}
