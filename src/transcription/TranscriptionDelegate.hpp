// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <transcription/Segment.hpp>

#include <vector>

namespace scribe
{

class TranscriptionSession;

/// @brief Receives the streaming events of a TranscriptionSession.
///
/// All methods are invoked on the session's delivery executor, never on the
/// engine thread. For one run the order is: zero or more (onProgress, onNewSegments)
/// pairs, then onCompletion.
class TranscriptionDelegate
{
  public:
    virtual ~TranscriptionDelegate() = default;

    /// @brief Estimated fraction of the audio processed so far.
    ///
    /// Derived from the end time of the latest segment, so it is not clamped and
    /// may slightly exceed 1.0 near the end of the audio.
    virtual void onProgress(TranscriptionSession& session, double progress) = 0;

    /// @brief A batch of newly finalized segments.
    /// @param startIndex Index of the first segment of the batch within the run.
    virtual void onNewSegments(TranscriptionSession& session, const std::vector<Segment>& segments, int startIndex)
        = 0;

    /// @brief The run finished successfully; @p segments is the complete result.
    virtual void onCompletion(TranscriptionSession& session, const std::vector<Segment>& segments) = 0;
};

} // namespace scribe
