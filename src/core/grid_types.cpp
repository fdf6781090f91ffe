/**
 * @file grid_types.cpp
 * @brief Names for grid diagnostics.
 */

#include "core/grid_types.h"

namespace chordgrid {

const char* gridErrorName(GridError error) {
  switch (error) {
    case GridError::InvalidChordLabel: return "InvalidChordLabel";
    case GridError::BeatArrayEmpty: return "BeatArrayEmpty";
    case GridError::IndexOutOfRange: return "IndexOutOfRange";
    case GridError::AmbiguousSegmentOverlap: return "AmbiguousSegmentOverlap";
    case GridError::NonMonotonicBeat: return "NonMonotonicBeat";
    case GridError::SchemaVersionUnsupported: return "SchemaVersionUnsupported";
    case GridError::PaddingOutOfRange: return "PaddingOutOfRange";
  }
  return "Unknown";
}

}  // namespace chordgrid
