#ifndef _PEPTIDE_HPP
#define	_PEPTIDE_HPP

#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <vector>
#include <string>

#include <boost/regex.hpp>

#include "MSMass.hpp"
#include "LocalizationError.hpp"

using namespace std;

/**
 * A peptide as written by the search engine, e.g. "LES[+79.966]LIEK" or
 * "K.LESLIEK.A", reduced to one mass per residue. Inline mass deltas are
 * added to the residue they follow.
 */
class Peptide {
public:
    string _modSequence;    // as given, flanks removed
    string _sequence;       // residues only
    vector<double> massVec; // one entry per residue, mods folded in

    // throws MalformedPeptideError
    explicit Peptide(const string &modified_pep);
    Peptide();

    size_t length () const {
        return massVec.size();
    }

private:
    void parseModSequence();
};

#endif	/* _PEPTIDE_HPP */

