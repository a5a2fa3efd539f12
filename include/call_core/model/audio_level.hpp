#pragma once

namespace call_core {

// Grades a raw level in [0, 1] into one of five buckets so that noise
// fluctuations below the first threshold all map to silence.
double truncate_audio_level(double level);

}
