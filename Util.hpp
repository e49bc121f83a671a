#ifndef _UTIL_HPP
#define	_UTIL_HPP

#include <unistd.h>
#include <stdlib.h>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <string>

using namespace std;

namespace LocUtil {

    template <class T> inline string toStr (const T &t) {
        stringstream ss;
        ss << t;
        return ss.str();
    }

    inline string toStr (double d, int precision) {
        stringstream ss;
        ss << fixed << setprecision(precision) << d;
        return ss.str();
    }

    // Shortest %g-style text that reads back as the same double
    inline string toStrExact (double d) {
        string out;
        for (int precision = 15; precision <= 17; precision++) {
            stringstream ss;
            ss << setprecision(precision) << d;
            out = ss.str();
            if (strtod(out.c_str(), NULL) == d)
                break;
        }
        return out;
    }

    /*
     * Virtual memory and resident set size in MB, read from /proc/self/stat.
     * Both come back as 0 where /proc isn't available.
     */
    inline void procMemUsage (double &vm_usage, double &resident_set) {
        vm_usage = 0.0;
        resident_set = 0.0;
        ifstream stat_stream("/proc/self/stat", ios_base::in);
        if (!stat_stream.is_open())
            return;

        string pid, comm, state, ppid, pgrp, session, tty_nr;
        string tpgid, flags, minflt, cminflt, majflt, cmajflt;
        string utime, stime, cutime, cstime, priority, nice;
        string O, itrealvalue, starttime;
        unsigned long vsize = 0;
        long rss = 0;

        stat_stream >> pid >> comm >> state >> ppid >> pgrp >> session >> tty_nr
                >> tpgid >> flags >> minflt >> cminflt >> majflt >> cmajflt
                >> utime >> stime >> cutime >> cstime >> priority >> nice
                >> O >> itrealvalue >> starttime >> vsize >> rss;
        stat_stream.close();

        long page_size_kb = sysconf(_SC_PAGE_SIZE) / 1024;
        vm_usage = vsize / 1024.0 / 1024.0;
        resident_set = rss * page_size_kb / 1024.0;
    }
}

using namespace LocUtil;

#endif	/* _UTIL_HPP */

