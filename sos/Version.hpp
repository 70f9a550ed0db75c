#pragma once

#define SOS_VERSION_MAJOR 1
#define SOS_VERSION_MINOR 0
#define SOS_VERSION_PATCH 0

#define SOS_VERSION_STRING "1.0.0"
#define SOS_FULL_VERSION "SOS Engine v1.0.0"

// Bumped whenever the journal record layout changes.
#define SOS_JOURNAL_FORMAT 1

namespace sos {
    constexpr const char* getVersion() { return SOS_VERSION_STRING; }
    constexpr const char* getFullVersion() { return SOS_FULL_VERSION; }
}
