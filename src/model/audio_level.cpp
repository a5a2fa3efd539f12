#include "call_core/model/audio_level.hpp"

namespace call_core {

double truncate_audio_level(double level) {
    // Also catches NaN.
    if (!(level > 0.01)) {
        return 0.0;
    }
    if (level < 0.2) {
        return 0.25;
    }
    if (level < 0.4) {
        return 0.5;
    }
    if (level < 0.6) {
        return 0.75;
    }
    return 1.0;
}

}
