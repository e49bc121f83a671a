#ifndef _FRAGMENT_HPP
#define	_FRAGMENT_HPP

#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <string>
#include <vector>

#include "MSMass.hpp"
#include "Peptide.hpp"

using namespace std;

enum IonSeries {
    PREFIX_ION, // b
    SUFFIX_ION  // y
};

/**
 * b and y fragment ladders of a peptide. Ladders are stored charge-major,
 * b[c][i] being the m/z of the (i+1)-residue b fragment at charge c+1.
 * Fragments are only computed up to 2+, and 2+ only for multiply charged
 * precursors.
 */
class FragmentTable {
public:
    string peptide;
    int max_charge;
    vector<double> massVec;
    vector< vector<double> > b;
    vector< vector<double> > y;

    // throws std::invalid_argument for precursor_charge < 1
    FragmentTable(const Peptide &pep, int precursor_charge);

    int getNumFragments () const {
        return massVec.empty() ? 0 : (int) massVec.size() - 1;
    }

    int getNumResidues () const {
        return (int) massVec.size();
    }

    const vector< vector<double> > & getLadder (IonSeries series) const {
        return series == PREFIX_ION ? b : y;
    }

private:
    void fragment();
};

#endif	/* _FRAGMENT_HPP */

