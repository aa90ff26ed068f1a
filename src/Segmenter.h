/* -*- c-basic-offset: 4 indent-tabs-mode: nil -*-  vi:set ts=8 sts=4 sw=4: */

/*
  Pianoscribe

  Transcription of piano recordings into two-staff notation.
    
  This program is free software; you can redistribute it and/or
  modify it under the terms of the GNU General Public License as
  published by the Free Software Foundation; either version 2 of the
  License, or (at your option) any later version.  See the file
  COPYING included with this distribution for more information.
*/

#ifndef PIANOSCRIBE_SEGMENTER_H
#define PIANOSCRIBE_SEGMENTER_H

#include "AudioBuffer.h"
#include "TranscriptionParameters.h"

#include <vector>

/**
 * A span [start, end) of the recording in seconds, start < end,
 * within which one chord or note is sought.
 */
struct OnsetSegment
{
    OnsetSegment() : start(0.0), end(0.0) { }
    OnsetSegment(double s, double e) : start(s), end(e) { }
    double start;
    double end;
    double getDuration() const { return end - start; }
};

/**
 * Divide a recording into note segments. Onset times come from the
 * OnsetDetector (or a fixed half-second grid when none are found),
 * and the recording's duration is appended as the final boundary.
 * Each span between adjacent boundaries then has its end pulled in
 * to the first sustained run of frames at or below the noise floor,
 * and is discarded if it is too short or too quiet overall.
 */
class Segmenter
{
public:
    Segmenter(int sampleRate, const TranscriptionParameters &params,
              double tempo);
    ~Segmenter();

    /**
     * Return the ascending segment boundaries in seconds for a
     * recording of the given duration with the given onset
     * strength. The last boundary is always the duration.
     */
    std::vector<double> findBoundaries(const std::vector<double> &strength,
                                       double duration) const;

    std::vector<OnsetSegment> segment(const AudioBuffer &buffer,
                                      const std::vector<double> &boundaries) const;

    /**
     * Return the RMS level of each analysis frame, frame i centred
     * on sample i * hop.
     */
    std::vector<double> getFrameLevels(const std::vector<float> &samples) const;

    /**
     * Return the noise floor for the given frame levels: the
     * multiplier times the given percentile, but no more than half
     * the median level.
     */
    double getNoiseFloor(const std::vector<double> &levels) const;

    /// Frames of quiet needed to end a segment early, in [3, 20]
    int getSilenceRunFrames() const;

    /// Shortest acceptable segment, in frames
    int getMinimumFrames() const;

    int getRejectedCount() const { return m_rejected; }

private:
    int m_sampleRate;
    TranscriptionParameters m_params;
    double m_tempo;
    mutable int m_rejected;
};

#endif
