#pragma once

/// @file notechart.h
/// @brief Main header for libnotechart - rhythm chart generation from audio.
/// @details Include this file to access all libnotechart functionality.

// Version information
#define NOTECHART_VERSION_MAJOR 1
#define NOTECHART_VERSION_MINOR 0
#define NOTECHART_VERSION_PATCH 0
#define NOTECHART_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/math_utils.h"
#include "util/types.h"

// Core
#include "core/audio.h"
#include "core/audio_io.h"

// Features
#include "feature/envelope.h"
#include "feature/onset_curve.h"

// Analysis
#include "analysis/chart_generator.h"
#include "analysis/difficulty.h"
#include "analysis/note_assigner.h"
#include "analysis/onset_picker.h"
#include "analysis/quantizer.h"
#include "analysis/tempo_estimator.h"

// I/O
#include "io/chart_json.h"

// Quick API
#include "quick.h"

namespace notechart {

/// @brief Returns the library version string.
/// @return Version string (e.g., "1.0.0")
inline const char* version() { return NOTECHART_VERSION_STRING; }

/// @brief Returns the major version number.
inline int version_major() { return NOTECHART_VERSION_MAJOR; }

/// @brief Returns the minor version number.
inline int version_minor() { return NOTECHART_VERSION_MINOR; }

/// @brief Returns the patch version number.
inline int version_patch() { return NOTECHART_VERSION_PATCH; }

}  // namespace notechart
