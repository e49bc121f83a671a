#include "SearchResult.hpp"
#include "Util.hpp"

string PsmRecord::getRecordId() const {
    return "row " + toStr(rowIndex) + ", scan " + scanId;
}

string LocalizationResult::getHeaderString() {
    string header = string("mod_position") + "\t"
            + "shifted_hyperscore" + "\t"
            + "delta_shifted_hyperscore";
    return header;
}

string LocalizationResult::getOutputString() const {
    string output = (toStr(position) + "\t"
            + toStrExact(score) + "\t"
            + toStrExact(deltaScore));
    return output;
}

string LocalizationFailure::getHeaderString() {
    return "row\tscannr\terror\tmessage";
}

string LocalizationFailure::getOutputString() const {
    return toStr(rowIndex) + "\t" + scanId + "\t" + kind + "\t" + message;
}
