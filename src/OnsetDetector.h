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

#ifndef PIANOSCRIBE_ONSET_DETECTOR_H
#define PIANOSCRIBE_ONSET_DETECTOR_H

#include "TranscriptionParameters.h"

#include <vector>

/**
 * Onset strength and onset picking. The strength curve is the
 * positive spectral flux of a mel-band dB power spectrum, one value
 * per analysis frame (frame i centred on sample i * hop), averaged
 * across bands. Onsets are peaks of that curve after thresholding.
 */
class OnsetDetector
{
public:
    OnsetDetector(int sampleRate, const TranscriptionParameters &params);
    ~OnsetDetector();

    std::vector<double> getStrength(const std::vector<float> &signal) const;

    /**
     * Zero the strength below the onset threshold, normalise to
     * [0,1], pick peaks and backtrack each to the preceding minimum.
     * Returns frame numbers in ascending order without repeats.
     */
    std::vector<int> pickOnsets(const std::vector<double> &strength) const;

    /**
     * As pickOnsets, converted to seconds.
     */
    std::vector<double> pickOnsetTimes(const std::vector<double> &strength) const;

    double getFrameDuration() const;

    static const int melBands = 128;

    /**
     * Return the indices n at which x[n] is the maximum of
     * x[n - preMax, n + postMax), is at least delta above the mean of
     * x[n - preAvg, n + postAvg), and lies more than wait frames
     * after the previously picked index.
     */
    static std::vector<int> peakPick(const std::vector<double> &x,
                                     int preMax, int postMax,
                                     int preAvg, int postAvg,
                                     double delta, int wait);

    /**
     * Move each event back to the nearest local minimum of the
     * curve at or before it (or to frame 0).
     */
    static std::vector<int> backtrack(const std::vector<int> &events,
                                      const std::vector<double> &curve);

private:
    int m_sampleRate;
    TranscriptionParameters m_params;
    std::vector<std::vector<double> > m_melFilters;

    void makeMelFilters();
};

#endif
