#ifndef _MSMASS_HPP
#define	_MSMASS_HPP

#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <math.h>

#include <tr1/unordered_map>

using namespace std;

/**
 * Monoisotopic residue masses and the physical constants used for fragment
 * m/z calculations. Everything here is initialized once at static-init time
 * and is read-only afterwards, so worker threads share it without locking.
 */
class MSMass {
public:
    static const double hydrogenMass;
    static const double oxygenMass;
    static const double waterMass;
    static const double protonMass;
    static const tr1::unordered_map<char, double> aa2mass;

    static bool isResidue (char c) {
        return aa2mass.find(c) != aa2mass.end();
    }

    // throws std::out_of_range for an unknown residue code
    static double residueMass (char c);

    static inline double mass2m_z (double mass, int z) {
        return (mass / (double) z) + protonMass;
    }

    static inline double m_z2mass (double m_z, int z) {
        return (m_z - protonMass) * (double) z;
    }

    static inline double ppm2Diff (double m_z, double ppm) {
        return m_z * ppm / 1000000.0;
    }

private:
    MSMass ();
    static tr1::unordered_map<char, double> initAAMass ();
};

#endif	/* _MSMASS_HPP */

