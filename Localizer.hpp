#ifndef _LOCALIZER_HPP
#define	_LOCALIZER_HPP

#include <iostream>
#include <string>
#include <vector>
#include <utility>

#include "LocalizationError.hpp"
#include "Peptide.hpp"
#include "Fragment.hpp"
#include "ShiftedFragments.hpp"
#include "Spectrum.hpp"
#include "Match.hpp"
#include "SearchResult.hpp"

using namespace std;

/**
 * Places the open-search mass shift of one PSM on the residue that best
 * explains its spectrum. Holds no per-record state, so one instance can be
 * shared by all worker threads.
 *
 * Hypothesis matrices are indexed by boundary. Boundary row k of the pair
 * corresponds to residue (length - 1 - k); results are reported in residue
 * order.
 */
class Localizer {
public:
    Localizer(const SpectrumLookup &lookup, const FragmentTolerance &tol);

    // throws MalformedPeptideError, SpectrumNotFoundError, DegenerateLadderError
    LocalizationResult localize(const PsmRecord &psm) const;

    // score one peptide against one spectrum, scores in residue order
    vector<double> scorePositions(const Peptide &pep, int charge, const Spectrum &dta, double shift_mass) const;

    static vector<double> boundaryToResidueOrder(const vector<double> &boundary_scores);
    static pair<int,int> selectTopTwo(const vector<double> &scores);

private:
    const SpectrumLookup * _lookup;
    FragmentTolerance _tol;
};

#endif	/* _LOCALIZER_HPP */

