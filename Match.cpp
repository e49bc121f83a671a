#include <stdexcept>

#include <boost/lexical_cast.hpp>

#include "Match.hpp"

SpectralMatch::SpectralMatch(const ShiftedFragments &b_shifts, const ShiftedFragments &y_shifts, const Spectrum &dta,
                             const FragmentTolerance &tol) {
    if (b_shifts.series != PREFIX_ION || y_shifts.series != SUFFIX_ION) {
        throw std::invalid_argument("SpectralMatch expects a b (prefix) and a y (suffix) hypothesis matrix");
    }
    if (b_shifts.getNumRows() != y_shifts.getNumRows()) {
        throw std::invalid_argument("Hypothesis matrices differ in size: "
                                    + boost::lexical_cast<string>(b_shifts.getNumRows()) + " b rows vs "
                                    + boost::lexical_cast<string>(y_shifts.getNumRows()) + " y rows");
    }
    if (!(b_shifts.shiftMass == y_shifts.shiftMass)) {
        throw std::invalid_argument("Hypothesis matrices carry different shifts: "
                                    + boost::lexical_cast<string>(b_shifts.shiftMass) + " vs "
                                    + boost::lexical_cast<string>(y_shifts.shiftMass));
    }
    if (dta._mzVector.size() != dta._ityVector.size()) {
        throw std::invalid_argument("Spectrum " + dta._id + " has unpaired m/z and intensity values");
    }
    setPeakWindows(dta, tol);
    computeScore(b_shifts, y_shifts);
}

void SpectralMatch::setPeakWindows(const Spectrum &dta, const FragmentTolerance &tol) {
    size_t n_peaks = dta.size();
    peakLo.resize(n_peaks);
    peakHi.resize(n_peaks);
    peakSqrtIty.resize(n_peaks);
    for (size_t p = 0; p < n_peaks; p++) {
        double m_z = dta._mzVector[p];
        peakLo[p] = m_z + MSMass::ppm2Diff(m_z, tol.lowPpm);
        peakHi[p] = m_z + MSMass::ppm2Diff(m_z, tol.highPpm);
        peakSqrtIty[p] = sqrt(dta._ityVector[p]);
    }
    return;
}

/*
 * Best contribution of any peak whose window holds this ion, 0 if none does.
 * Plain scan over all peaks, peak order doesn't matter.
 */
double SpectralMatch::matchIon(double m_z) const {
    double best = 0.0;
    const size_t n_peaks = peakLo.size();
    for (size_t p = 0; p < n_peaks; p++) {
        if (m_z > peakLo[p] && m_z < peakHi[p] && peakSqrtIty[p] > best) {
            best = peakSqrtIty[p];
        }
    }
    return best;
}

void SpectralMatch::computeScore(const ShiftedFragments &b_shifts, const ShiftedFragments &y_shifts) {
    int n_rows = b_shifts.getNumRows();
    scores.resize(n_rows);
    nMatchedB.resize(n_rows);
    nMatchedY.resize(n_rows);
    dotSum.resize(n_rows);

    for (int k = 0; k < n_rows; k++) {
        int n_b = 0;
        int n_y = 0;
        double dot = 0.0;
        // b columns first, then y columns, in column order
        const vector<double> &b_row = b_shifts.rows[k];
        for (size_t col = 0; col < b_row.size(); col++) {
            double contribution = matchIon(b_row[col]);
            if (contribution > 0.0) {
                n_b++;
                dot += contribution;
            }
        }
        const vector<double> &y_row = y_shifts.rows[k];
        for (size_t col = 0; col < y_row.size(); col++) {
            double contribution = matchIon(y_row[col]);
            if (contribution > 0.0) {
                n_y++;
                dot += contribution;
            }
        }
        nMatchedB[k] = n_b;
        nMatchedY[k] = n_y;
        dotSum[k] = dot;
        scores[k] = (dot > 0.0 ? log(dot) : 0.0) + logFactorial(n_b) + logFactorial(n_y);
    }
    return;
}

// ln(n!) as a running sum of logs, no integer overflow for large n
double SpectralMatch::logFactorial(int n) {
    double log_fact = 0.0;
    for (int i = 2; i <= n; i++) {
        log_fact += log((double) i);
    }
    return log_fact;
}
