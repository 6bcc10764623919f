//
//  silence_segment.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace cutplan {

/// @ingroup api
/// Raw detection as delivered by the silence analysis collaborator.
struct SilenceDetection {
    std::string id;
    std::string recording_id;
    double start_time = 0;
    double end_time = 0;
    double average_decibels = 0;
};

/// @ingroup api
/// Ledger entry: a detected silence plus the user's keep/cut decision.
struct SilenceSegment {
    std::string id;                ///< Unique identifier
    std::string recording_id;      ///< Recording the silence was detected in
    double start_time = 0;         ///< Silence start (s)
    double end_time = 0;           ///< Silence end (s)
    double duration = 0;           ///< end_time - start_time
    double average_decibels = 0;   ///< Mean level over the span (dB)
    bool deleted = false;          ///< Cut from export
    bool reviewed = false;         ///< User has accepted or rejected it
};

}  // namespace cutplan
