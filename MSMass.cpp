#include <stdexcept>

#include "MSMass.hpp"

const double MSMass::hydrogenMass = 1.007825035;
const double MSMass::oxygenMass = 15.99491463;
const double MSMass::waterMass = 2 * MSMass::hydrogenMass + MSMass::oxygenMass;
const double MSMass::protonMass = 1.00727646688;
const tr1::unordered_map<char, double> MSMass::aa2mass = MSMass::initAAMass();

tr1::unordered_map<char, double> MSMass::initAAMass() {
    tr1::unordered_map<char, double> aa_mass;
    aa_mass['G'] = 57.021463735;
    aa_mass['A'] = 71.037113805;
    aa_mass['S'] = 87.032028435;
    aa_mass['P'] = 97.052763875;
    aa_mass['V'] = 99.068413945;
    aa_mass['T'] = 101.047678505;
    aa_mass['C'] = 103.009184505; // unmodified, carbamidomethyl comes in as an inline mod
    aa_mass['L'] = 113.084064015;
    aa_mass['I'] = 113.084064015;
    aa_mass['N'] = 114.042927470;
    aa_mass['D'] = 115.026943065;
    aa_mass['Q'] = 128.058577540;
    aa_mass['K'] = 128.094963050;
    aa_mass['E'] = 129.042593135;
    aa_mass['M'] = 131.040484645;
    aa_mass['H'] = 137.058911875;
    aa_mass['F'] = 147.068413945;
    aa_mass['U'] = 150.953633405; // selenocysteine
    aa_mass['R'] = 156.101111050;
    aa_mass['Y'] = 163.063328575;
    aa_mass['W'] = 186.079312980;
    aa_mass['O'] = 237.147726925; // pyrrolysine
    return aa_mass;
}

double MSMass::residueMass (char c) {
    tr1::unordered_map<char, double>::const_iterator a2mIt = aa2mass.find(c);
    if (a2mIt == aa2mass.end()) {
        throw std::out_of_range(string("Residue '") + c + "' is not recognized");
    }
    return a2mIt->second;
}
