#include "Peptide.hpp"

#include <boost/lexical_cast.hpp>

Peptide::Peptide(const string &modified_pep) {
    // strip optional flanking residues, "K.PEPTIDE.R" or "-.PEPTIDE.-"
    const boost::regex re("^([A-Z\\-]\\.){0,1}(.+?)(\\.[A-Z\\-]){0,1}$");
    boost::match_results<string::const_iterator> regex_result;
    if (!modified_pep.empty() && boost::regex_match(modified_pep, regex_result, re)) {
        _modSequence = regex_result[2];
    } else {
        throw MalformedPeptideError(modified_pep, "Empty peptide sequence");
    }
    parseModSequence();
}

Peptide::Peptide() {
    _modSequence = "";
    _sequence = "";
}

/*
 * Walk the tokens left to right. Every character has to belong to a token,
 * anything the pattern skips over is reported as unexpected.
 */
void Peptide::parseModSequence() {
    const boost::regex re("([A-Z])|([+-](?:\\d+(?:\\.\\d*)?|\\.\\d+))|([\\[\\]])");
    boost::sregex_iterator reIt(_modSequence.begin(), _modSequence.end(), re);
    boost::sregex_iterator end;
    long expected_pos = 0;
    for (; reIt != end; ++reIt) {
        const boost::smatch &m = *reIt;
        if (m.position() != expected_pos) {
            throw MalformedPeptideError(_modSequence, "Unexpected character '" + string(1, _modSequence[expected_pos])
                                        + "' at position " + boost::lexical_cast<string>(expected_pos));
        }
        expected_pos += m.length();

        if (m[1].matched) {
            char aa = ((string) m[1])[0];
            if (!MSMass::isResidue(aa)) {
                throw MalformedPeptideError(_modSequence, "Unknown residue '" + string(1, aa) + "'");
            }
            _sequence += aa;
            massVec.push_back(MSMass::residueMass(aa));
        } else if (m[2].matched) {
            if (massVec.empty()) {
                throw MalformedPeptideError(_modSequence, "Modification " + (string) m[2] + " precedes any residue");
            }
            massVec.back() += atof(((string) m[2]).c_str());
        }
        // brackets only delimit mods
    }
    if (expected_pos != (long) _modSequence.length()) {
        throw MalformedPeptideError(_modSequence, "Unexpected character '" + string(1, _modSequence[expected_pos])
                                    + "' at position " + boost::lexical_cast<string>(expected_pos));
    }
    if (massVec.empty()) {
        throw MalformedPeptideError(_modSequence, "No residues in peptide sequence");
    }
    return;
}
