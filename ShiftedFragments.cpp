#include "ShiftedFragments.hpp"

ShiftedFragments::ShiftedFragments(const vector< vector<double> > &ladder, IonSeries ion_series, double shift_mass)
    : series(ion_series), shiftMass(shift_mass) {
    enumerateShifts(ladder);
}

ShiftedFragments::ShiftedFragments(const FragmentTable &ft, IonSeries ion_series, double shift_mass)
    : series(ion_series), shiftMass(shift_mass) {
    enumerateShifts(ft.getLadder(ion_series));
}

void ShiftedFragments::enumerateShifts(const vector< vector<double> > &ladder) {
    numCharges = ladder.size();
    numFragments = numCharges > 0 ? ladder[0].size() : 0;
    rows.assign(numFragments + 1, vector<double> (getNumColumns()));

    for (int k = 0; k <= numFragments; k++) {
        vector<double> &row = rows[k];
        for (int c = 0; c < numCharges; c++) {
            double shift_m_z = shiftMass / (double) (c + 1);
            for (int i = 0; i < numFragments; i++) {
                bool shifted = (series == PREFIX_ION) ? (i < k) : (i >= k);
                row[column(c, i)] = shifted ? ladder[c][i] + shift_m_z : ladder[c][i];
            }
        }
    }
    return;
}
