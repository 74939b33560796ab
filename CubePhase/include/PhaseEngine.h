#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <variant>

#include "CubeTypes.h"
#include "OllClassifier.h"
#include "PllClassifier.h"

// Ordered by solve progress
enum class Phase { Scrambled, Cross, F2L, OLL, PLL, Solved };

enum class F2LStage {
    FirstLayer,   // base corners pending
    SecondLayer   // corners done, middle edges pending
};

struct CrossDetail {};

struct F2LDetail {
    std::optional<F2LStage> stage;  // empty once two or more pairs are in
    int missingCount{0};
};

struct OllDetail {
    OllCase ollCase{OllCase::Unknown};
};

struct PllDetail {
    PllCase pllCase{PllCase::Unknown};
};

struct SolvedDetail {};

bool operator==(const CrossDetail&, const CrossDetail&);
bool operator==(const F2LDetail& a, const F2LDetail& b);
bool operator==(const OllDetail& a, const OllDetail& b);
bool operator==(const PllDetail& a, const PllDetail& b);
bool operator==(const SolvedDetail&, const SolvedDetail&);

using PhaseDetail = std::variant<CrossDetail, F2LDetail, OllDetail, PllDetail, SolvedDetail>;

struct AnalysisResult {
    std::optional<Face> baseFace;  // empty when no face reaches the cross
    PhaseDetail detail{CrossDetail{}};

    Phase phase() const;
    bool isSolved() const { return std::holds_alternative<SolvedDetail>(detail); }

    const F2LDetail* f2l() const { return std::get_if<F2LDetail>(&detail); }
    const OllDetail* oll() const { return std::get_if<OllDetail>(&detail); }
    const PllDetail* pll() const { return std::get_if<PllDetail>(&detail); }
};

bool operator==(const AnalysisResult& a, const AnalysisResult& b);
bool operator!=(const AnalysisResult& a, const AnalysisResult& b);

const char* phaseName(Phase phase);
int phaseRank(Phase phase);
const char* f2lStageName(F2LStage stage);
std::ostream& operator<<(std::ostream& os, Phase phase);

// One-line summary as shown on the phase panel
std::string describeAnalysis(const AnalysisResult& result);

namespace PhaseEngine {

// Furthest phase reachable treating the given center as the base.
// Empty when the id is not a center or its cross is not solved.
std::optional<AnalysisResult> evaluateBase(const CubeSnapshot& pieces, int centerId);

// Tries all six centers and reports the most advanced base
AnalysisResult analyzeCube(const CubeSnapshot& pieces);

}
