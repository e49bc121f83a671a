#ifndef _MATCH_HPP
#define	_MATCH_HPP

#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

#include "Spectrum.hpp"
#include "ShiftedFragments.hpp"

using namespace std;

/**
 * Asymmetric fragment tolerance in ppm. A peak at p accepts anything strictly
 * inside (p + p*lowPpm/1e6, p + p*highPpm/1e6).
 */
struct FragmentTolerance {
    double lowPpm;
    double highPpm;

    FragmentTolerance() : lowPpm(-10.0), highPpm(10.0) {}
    FragmentTolerance(double lo, double hi) : lowPpm(lo), highPpm(hi) {}
};

/**
 * Scores every row of a pair of shift hypothesis matrices against one
 * spectrum. For each predicted ion the best matching peak contributes
 * sqrt(intensity); a row scores
 *     ln(sum of contributions) + ln(nB!) + ln(nY!)
 * with nB/nY the number of matched b/y columns. Scores come out in the
 * matrices' row (boundary) order.
 */
class SpectralMatch {
public:
    vector<double> scores;
    vector<int> nMatchedB;
    vector<int> nMatchedY;
    vector<double> dotSum;

    // throws std::invalid_argument if the matrices don't belong together
    SpectralMatch(const ShiftedFragments &b_shifts, const ShiftedFragments &y_shifts, const Spectrum &dta,
                  const FragmentTolerance &tol);

    int getNumHypotheses () const {
        return (int) scores.size();
    }

    static double logFactorial(int n);


private:
    vector<double> peakLo;
    vector<double> peakHi;
    vector<double> peakSqrtIty;

    void setPeakWindows(const Spectrum &dta, const FragmentTolerance &tol);
    double matchIon(double m_z) const;
    void computeScore(const ShiftedFragments &b_shifts, const ShiftedFragments &y_shifts);
};

#endif	/* _MATCH_HPP */

