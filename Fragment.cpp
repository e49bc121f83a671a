#include <stdexcept>

#include <boost/lexical_cast.hpp>

#include "Fragment.hpp"

FragmentTable::FragmentTable(const Peptide &pep, int precursor_charge) {
    if (precursor_charge < 1) {
        throw std::invalid_argument("Precursor charge must be positive, got " + boost::lexical_cast<string>(precursor_charge));
    }
    peptide = pep._modSequence;
    massVec = pep.massVec;
    max_charge = precursor_charge > 1 ? 2 : 1;

    b.resize(max_charge, vector<double> (getNumFragments()));
    y.resize(max_charge, vector<double> (getNumFragments()));
    fragment();
}

/*
 * Neutral fragment masses are summed in residue order from either terminus and
 * only then converted to m/z, so each charge state sees the same sums.
 */
void FragmentTable::fragment() {
    double b_mass = 0.0;
    double y_mass = MSMass::waterMass;

    for (int i = 0; i < getNumFragments(); i++) {
        // j here is the index into massVec
        int j = massVec.size() - 1 - i;
        b_mass += massVec[i];
        y_mass += massVec[j];
        for (int c = 0; c < max_charge; c++) {
            b[c][i] = MSMass::mass2m_z(b_mass, c + 1);
            y[c][i] = MSMass::mass2m_z(y_mass, c + 1);
        }
    }
    return;
}
