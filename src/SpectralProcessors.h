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

#ifndef PIANOSCRIBE_SPECTRAL_PROCESSORS_H
#define PIANOSCRIBE_SPECTRAL_PROCESSORS_H

#include "Stft.h"

#include <vector>

/**
 * Stationary noise suppression by spectral gating. The noise
 * statistics are taken from the whole signal: a bin is considered
 * signal in a frame when its level exceeds the bin's mean level by
 * more than 1.5 standard deviations. The resulting mask is smoothed
 * over about 500 Hz and 50 ms, and non-signal content is reduced by
 * the given proportion rather than removed outright.
 */
class NoiseReducer
{
public:
    NoiseReducer(int sampleRate, int fftSize, int hopSize, float reduction);

    std::vector<float> process(const std::vector<float> &signal) const;

private:
    int m_sampleRate;
    Stft m_stft;
    float m_reduction;
};

/**
 * Harmonic/percussive separation by median filtering of the
 * magnitude spectrogram: along time for harmonic content, along
 * frequency for percussive. Only the harmonic part is returned,
 * masked with a soft mask in which the percussive estimate is scaled
 * by the margin before comparison.
 */
class HarmonicSeparator
{
public:
    HarmonicSeparator(int fftSize, int hopSize, float margin);

    std::vector<float> process(const std::vector<float> &signal) const;

    static const int kernelSize = 31;

private:
    Stft m_stft;
    float m_margin;
};

#endif
