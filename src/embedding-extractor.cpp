#include "embedding-extractor.h"

#include <cmath>

bool l2_normalize(speaker_embedding & v) {
    double sum = 0.0;
    for (float x : v) {
        sum += (double) x * (double) x;
    }
    const double norm = std::sqrt(sum);
    if (!(norm > 0.0) || !std::isfinite(norm)) {
        return false;
    }
    for (float & x : v) {
        x = (float) ((double) x / norm);
    }
    return true;
}
