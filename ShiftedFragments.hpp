#ifndef _SHIFTEDFRAGMENTS_HPP
#define	_SHIFTEDFRAGMENTS_HPP

#include <iostream>
#include <vector>

#include "Fragment.hpp"

using namespace std;

/**
 * Every placement of a mass shift on one ion series. Row k holds the whole
 * ladder, flattened charge-major, with the shift applied as if it sat at
 * boundary k:
 *   PREFIX_ION: fragments with index <  k carry shift/z
 *   SUFFIX_ION: fragments with index >= k carry shift/z
 * There is one row more than there are fragments, so row 0 of a prefix
 * matrix is the bare ladder and its last row is fully shifted; a suffix
 * matrix runs the other way round.
 */
class ShiftedFragments {
public:
    IonSeries series;
    double shiftMass;
    int numFragments;
    int numCharges;
    vector< vector<double> > rows;

    ShiftedFragments(const vector< vector<double> > &ladder, IonSeries ion_series, double shift_mass);
    ShiftedFragments(const FragmentTable &ft, IonSeries ion_series, double shift_mass);

    int getNumRows () const {
        return (int) rows.size();
    }

    int getNumColumns () const {
        return numFragments * numCharges;
    }

    // column of fragment i at charge index c within a row
    int column (int c, int i) const {
        return c * numFragments + i;
    }

private:
    void enumerateShifts(const vector< vector<double> > &ladder);
};

#endif	/* _SHIFTEDFRAGMENTS_HPP */

