#pragma once
#include "esp_err.h"

// Error codes of the audio-to-light pipeline, registered above the ESP-IDF ranges.
#define ORGAN_ERR_BASE 0x7a00
#define ORGAN_ERR_DEVICE (ORGAN_ERR_BASE + 1)            // capture device unavailable/unreadable
#define ORGAN_ERR_UNDERRUN (ORGAN_ERR_BASE + 2)          // block dropped before analysis
#define ORGAN_ERR_MALFORMED_FRAME (ORGAN_ERR_BASE + 3)   // wire line rejected by the consumer
#define ORGAN_ERR_TRANSPORT_CLOSED (ORGAN_ERR_BASE + 4)  // output sink went away
#define ORGAN_ERR_END_OF_STREAM (ORGAN_ERR_BASE + 5)     // finite input ended

const char* organ_err_to_name(esp_err_t err);
