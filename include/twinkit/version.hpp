#pragma once

#define TWINKIT_VERSION_MAJOR 1
#define TWINKIT_VERSION_MINOR 0
#define TWINKIT_VERSION_PATCH 0

#define TWINKIT_VERSION_STRING "1.0.0"
