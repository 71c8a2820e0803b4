#pragma once

// ==============================================================================
// Version Information
// ==============================================================================

#define DSPI_CONSOLE_VERSION_MAJOR 1
#define DSPI_CONSOLE_VERSION_MINOR 2
#define DSPI_CONSOLE_VERSION_PATCH 0

#define DSPI_CONSOLE_STRINGIFY_(x) #x
#define DSPI_CONSOLE_STRINGIFY(x) DSPI_CONSOLE_STRINGIFY_(x)

#define DSPI_CONSOLE_VERSION_STR \
    DSPI_CONSOLE_STRINGIFY(DSPI_CONSOLE_VERSION_MAJOR) "." \
    DSPI_CONSOLE_STRINGIFY(DSPI_CONSOLE_VERSION_MINOR) "." \
    DSPI_CONSOLE_STRINGIFY(DSPI_CONSOLE_VERSION_PATCH)

#define DSPI_CONSOLE_NAME "DSPi Console"
