#include "PhaseEngine.h"
#include "PieceClassifier.h"
#include "PlacementOracle.h"

#include <algorithm>
#include <cctype>
#include <sstream>

bool operator==(const CrossDetail&, const CrossDetail&) { return true; }
bool operator==(const F2LDetail& a, const F2LDetail& b) {
    return a.stage == b.stage && a.missingCount == b.missingCount;
}
bool operator==(const OllDetail& a, const OllDetail& b) { return a.ollCase == b.ollCase; }
bool operator==(const PllDetail& a, const PllDetail& b) { return a.pllCase == b.pllCase; }
bool operator==(const SolvedDetail&, const SolvedDetail&) { return true; }

bool operator==(const AnalysisResult& a, const AnalysisResult& b) {
    return a.baseFace == b.baseFace && a.detail == b.detail;
}

bool operator!=(const AnalysisResult& a, const AnalysisResult& b) {
    return !(a == b);
}

Phase AnalysisResult::phase() const {
    switch (detail.index()) {
        case 0: return Phase::Cross;
        case 1: return Phase::F2L;
        case 2: return Phase::OLL;
        case 3: return Phase::PLL;
        case 4: return Phase::Solved;
        default: return Phase::Scrambled;
    }
}

const char* phaseName(Phase phase) {
    switch (phase) {
        case Phase::Scrambled: return "Scrambled";
        case Phase::Cross:     return "Cross";
        case Phase::F2L:       return "F2L";
        case Phase::OLL:       return "OLL";
        case Phase::PLL:       return "PLL";
        case Phase::Solved:    return "Solved";
    }
    return "Scrambled";
}

int phaseRank(Phase phase) {
    return static_cast<int>(phase);
}

const char* f2lStageName(F2LStage stage) {
    return stage == F2LStage::FirstLayer ? "First Layer" : "Second Layer";
}

std::ostream& operator<<(std::ostream& os, Phase phase) {
    return os << phaseName(phase);
}

std::string describeAnalysis(const AnalysisResult& result) {
    std::string phase = phaseName(result.phase());
    std::transform(phase.begin(), phase.end(), phase.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });

    std::ostringstream out;
    out << phase;

    if (const F2LDetail* f2l = result.f2l()) {
        const char* unit = "PAIRS";
        if (f2l->stage) {
            std::string stage = f2lStageName(*f2l->stage);
            std::transform(stage.begin(), stage.end(), stage.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
            out << " | " << stage;
            unit = (*f2l->stage == F2LStage::FirstLayer) ? "CORNERS" : "EDGES";
        }
        out << " | " << f2l->missingCount << " " << unit << " LEFT";
    } else if (const OllDetail* oll = result.oll()) {
        out << " | Case: " << ollCaseName(oll->ollCase);
    } else if (const PllDetail* pll = result.pll()) {
        out << " | Case: " << pllCaseName(pll->pllCase);
    }

    if (result.baseFace) {
        out << " | Base: " << faceColorName(*result.baseFace);
    }
    return out.str();
}

namespace PhaseEngine {
namespace {
AnalysisResult evaluateLastLayer(const CubeSnapshot& pieces, const Piece& base) {
    AnalysisResult result;
    result.baseFace = PieceClassifier::originFace(base);

    std::optional<Piece> top = PieceClassifier::oppositeCenter(pieces, base);
    if (!top) {
        result.detail = OllDetail{OllCase::Unknown};
        return result;
    }

    const std::vector<Piece> topPieces = PieceClassifier::layerPieces(pieces, *top);
    const bool oriented = std::all_of(topPieces.begin(), topPieces.end(), [&](const Piece& p) {
        return PlacementOracle::isOrientedForTopLayer(p, *top);
    });

    if (!oriented) {
        result.detail = OllDetail{OllClassifier::identify(topPieces, *top)};
        return result;
    }

    const PllCase pllCase = PllClassifier::identify(topPieces, *top);
    if (pllCase != PllCase::Solved) {
        result.detail = PllDetail{pllCase};
        return result;
    }

    // A permuted layer still has to line up with the side centers
    const std::vector<Piece> centers = PieceClassifier::centers(pieces);
    const bool aligned = std::all_of(topPieces.begin(), topPieces.end(), [&](const Piece& p) {
        return PlacementOracle::isSeated(p, centers);
    });
    if (aligned) {
        result.detail = SolvedDetail{};
    } else {
        result.detail = PllDetail{PllCase::Auf};
    }
    return result;
}

std::optional<AnalysisResult> evaluateCenter(const CubeSnapshot& pieces, const Piece& center) {
    const std::vector<Piece> centers = PieceClassifier::centers(pieces);
    auto placed = [&](const Piece& piece) {
        return PlacementOracle::isCorrectlyPlaced(piece, center) &&
               PlacementOracle::isSeated(piece, centers);
    };

    const std::vector<Piece> cross = PieceClassifier::crossEdges(pieces, center);
    const bool crossSolved = std::all_of(cross.begin(), cross.end(), placed);
    if (!crossSolved) return std::nullopt;

    const int baseAxis = PieceClassifier::baseAxisIndex(center);
    int solvedPairs = 0;
    int solvedCorners = 0;
    int solvedEdges = 0;

    for (const auto& corner : PieceClassifier::layerCorners(pieces, center)) {
        const bool cornerSolved = placed(corner);
        if (cornerSolved) ++solvedCorners;

        std::optional<Piece> edge = PieceClassifier::pairedEdge(pieces, corner, baseAxis);
        if (edge) {
            const bool edgeSolved = placed(*edge);
            if (edgeSolved) ++solvedEdges;
            if (cornerSolved && edgeSolved) ++solvedPairs;
        }
    }

    if (solvedPairs == 4) {
        return evaluateLastLayer(pieces, center);
    }

    AnalysisResult result;
    result.baseFace = PieceClassifier::originFace(center);
    F2LDetail f2l;
    if (solvedPairs >= 2) {
        f2l.missingCount = 4 - solvedPairs;
    } else if (solvedCorners == 4) {
        f2l.stage = F2LStage::SecondLayer;
        f2l.missingCount = 4 - solvedEdges;
    } else {
        f2l.stage = F2LStage::FirstLayer;
        f2l.missingCount = 4 - solvedCorners;
    }
    result.detail = f2l;
    return result;
}
} // namespace

std::optional<AnalysisResult> evaluateBase(const CubeSnapshot& pieces, int centerId) {
    std::optional<Piece> center = PieceClassifier::findById(pieces, centerId);
    if (!center || !PieceClassifier::isCenter(*center)) return std::nullopt;
    return evaluateCenter(pieces, *center);
}

AnalysisResult analyzeCube(const CubeSnapshot& pieces) {
    std::optional<AnalysisResult> best;

    for (const auto& center : PieceClassifier::centers(pieces)) {
        std::optional<AnalysisResult> candidate = evaluateCenter(pieces, center);
        if (!candidate) continue;

        if (!best || phaseRank(candidate->phase()) > phaseRank(best->phase())) {
            best = candidate;
            continue;
        }
        // Same F2L rank: prefer the base with fewer missing pieces
        if (candidate->phase() == Phase::F2L && best->phase() == Phase::F2L &&
            candidate->f2l()->missingCount < best->f2l()->missingCount) {
            best = candidate;
        }
    }

    if (!best) {
        // Nothing reaches the cross: report Cross with no base
        return AnalysisResult{};
    }
    return *best;
}

}
