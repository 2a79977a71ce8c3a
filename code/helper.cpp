
#include "helper.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

using namespace std;



double round_double_n(double x, unsigned int decimal_places) {
    double factor = pow(10.0, (double) decimal_places);
    return round(x * factor) / factor;
}

bool is_approx_equal(double a, double b, double abs_tol, double rel_tol) {
    if (a == b)
        return true;
    // inf - inf is nan, only identical infinities are equal
    if (isinf(a) || isinf(b))
        return false;
    return fabs(a - b) <= abs_tol + rel_tol * max(fabs(a), fabs(b));
}

string to_lower_trimmed(const string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    string retval = str.substr(first, last - first + 1);
    transform(retval.begin(), retval.end(), retval.begin(),
              [](unsigned char c) { return (char) tolower(c); });
    return retval;
}

double hour_of_day_at_step(size_t t, double timestep_hours, double start_hour) {
    double h = fmod(start_hour + (double) t * timestep_hours, 24.0);
    if (h < 0.0)
        h += 24.0;
    // protect against rounding artefacts like 7.9999999999 for steps of 1/3 h
    h = round_double_n(h, 6);
    if (h >= 24.0)
        h -= 24.0;
    return h;
}
