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

#ifndef PIANOSCRIBE_TEMPO_ESTIMATOR_H
#define PIANOSCRIBE_TEMPO_ESTIMATOR_H

#include "TranscriptionParameters.h"

#include <vector>

static const double defaultTempo = 120.0;
static const double minimumTempo = 20.0;
static const double maximumTempo = 300.0;

/**
 * Return bpm if it lies within [20, 300], otherwise the default of
 * 120. A substituted value is logged.
 */
double clampTempo(double bpm);

/// Length of a sixteenth note in seconds at the given tempo
inline double sixteenthDuration(double bpm) { return 15.0 / bpm; }

/// Length of a quarter note in seconds at the given tempo
inline double quarterDuration(double bpm) { return 60.0 / bpm; }

/**
 * A single global tempo for a recording, from the autocorrelation of
 * its onset strength curve weighted by a log-normal preference for
 * tempi near 120 BPM.
 */
class TempoEstimator
{
public:
    TempoEstimator(int sampleRate, const TranscriptionParameters &params);
    ~TempoEstimator();

    /**
     * Return the tempo to use for the recording with the given onset
     * strength: the override if one is set, otherwise the tracked
     * tempo, in either case passed through clampTempo.
     */
    double estimate(const std::vector<double> &strength) const;

    /**
     * Return the raw tracked tempo in BPM, or 0 if the strength
     * curve has no variation to track.
     */
    double track(const std::vector<double> &strength) const;

private:
    int m_sampleRate;
    TranscriptionParameters m_params;
};

#endif
