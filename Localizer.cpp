#include <boost/math/special_functions/fpclassify.hpp>

#include "Localizer.hpp"
#include "Util.hpp"

Localizer::Localizer(const SpectrumLookup &lookup, const FragmentTolerance &tol)
    : _lookup(&lookup), _tol(tol) {
}

LocalizationResult Localizer::localize(const PsmRecord &psm) const {
    string record_id = psm.getRecordId();
    if (psm.charge < 1) {
        throw MalformedRecordError("Precursor charge must be positive, got " + toStr(psm.charge), record_id);
    }
    if (!(boost::math::isfinite)(psm.getDeltaMass())) {
        throw MalformedRecordError("Mass shift is not finite (expmass " + toStr(psm.expMass)
                                   + ", calcmass " + toStr(psm.calcMass) + ")", record_id);
    }

    Peptide pep;
    try {
        pep = Peptide(psm.peptide);
    } catch (LocalizationError &e) {
        e.setRecordId(record_id);
        throw;
    }
    if (pep.length() < 2) {
        throw DegenerateLadderError(psm.peptide, pep.length(), record_id);
    }

    const Spectrum * dta = _lookup->findSpectrum(psm.scanId);
    if (dta == NULL) {
        throw SpectrumNotFoundError(psm.scanId, record_id);
    }

    LocalizationResult result;
    result.positionScores = scorePositions(pep, psm.charge, *dta, psm.getDeltaMass());

    pair<int,int> top = selectTopTwo(result.positionScores);
    result.position = top.first;
    result.score = result.positionScores[top.first];
    result.deltaScore = result.score - result.positionScores[top.second];
    return result;
}

vector<double> Localizer::scorePositions(const Peptide &pep, int charge, const Spectrum &dta, double shift_mass) const {
    FragmentTable ft(pep, charge);
    ShiftedFragments b_shifts(ft, PREFIX_ION, shift_mass);
    ShiftedFragments y_shifts(ft, SUFFIX_ION, shift_mass);
    SpectralMatch sm(b_shifts, y_shifts, dta, _tol);
    return boundaryToResidueOrder(sm.scores);
}

/*
 * Boundary row k scores the shift on residue (n - 1 - k): its suffix rows
 * shift exactly the y ions that contain that residue. Reversing the vector
 * puts residue 0 first.
 */
vector<double> Localizer::boundaryToResidueOrder(const vector<double> &boundary_scores) {
    return vector<double> (boundary_scores.rbegin(), boundary_scores.rend());
}

// Indices of the highest and second highest score, earlier index wins ties
pair<int,int> Localizer::selectTopTwo(const vector<double> &scores) {
    int best = -1;
    int second = -1;
    for (int i = 0; i < (int) scores.size(); i++) {
        if (best < 0 || scores[i] > scores[best]) {
            second = best;
            best = i;
        } else if (second < 0 || scores[i] > scores[second]) {
            second = i;
        }
    }
    if (second < 0) {
        second = best;
    }
    return make_pair(best, second);
}
