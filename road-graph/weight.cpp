#include <cmath>
#include <limits>
#include <string>

#include "route_errors.hpp"
#include "weight.hpp"

using namespace std;

Weight encode_weight(double distance) {
    if (!isfinite(distance)) {
        throw InvalidWeight("Distance must be finite");
    }
    if (distance < 0.0) {
        throw InvalidWeight("Distance must not be negative: " + to_string(distance));
    }
    // std::round rounds halfway cases away from zero
    double scaled = round(distance * static_cast<double>(WEIGHT_SCALE));
    if (scaled > static_cast<double>(MAX_WEIGHT)) {
        throw InvalidWeight("Distance too large: " + to_string(distance));
    }
    return static_cast<Weight>(scaled);
}

Weight add_weights(Weight a, Weight b) {
    if (b > numeric_limits<Weight>::max() - a) {
        throw InvalidWeight("Distance sum overflows: " + to_string(a) + " + " + to_string(b) + " tenths");
    }
    return a + b;
}

double decode_weight(Weight weight) {
    return static_cast<double>(weight) / static_cast<double>(WEIGHT_SCALE);
}

string format_weight(Weight weight) {
    return to_string(weight / WEIGHT_SCALE) + "." + to_string(weight % WEIGHT_SCALE);
}
