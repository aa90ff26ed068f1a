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

#ifndef PIANOSCRIBE_DYNAMICS_SHAPER_H
#define PIANOSCRIBE_DYNAMICS_SHAPER_H

#include "Filters.h"

struct TranscriptionParameters;

/**
 * Level shaping ahead of harmonic separation: a downward-expanding
 * noise gate, a compressor, a low-shelf boost and makeup gain, in
 * that order. Level is detected as the RMS of a short sliding window
 * of input history, and gain changes are smoothed with separate
 * attack and release rates.
 */
class DynamicsShaper
{
public:
    DynamicsShaper(int sampleRate, const TranscriptionParameters &params);
    ~DynamicsShaper();

    void reset();

    /**
     * Process n samples from in to out. The two may be the same.
     */
    void process(const float *in, float *out, int n);

    /**
     * Return the combined gate and compressor gain applied to the
     * most recent sample, excluding shelf and makeup.
     */
    float getGain() const { return m_gateGain * m_compressorGain; }

private:
    float processSingle(float sample);
    void updateRMS(float);

    int m_sampleRate;

    float m_gateThresholdDb;
    float m_gateRatio;
    float m_compressorThresholdDb;
    float m_compressorRatio;
    float m_makeup;

    float m_attack;
    float m_gateRelease;
    float m_compressorRelease;

    Biquad m_shelf;

    float *m_history;
    int m_histlen;
    int m_histwrite;
    int m_histread;

    double m_sumOfSquares;
    float m_rms;
    float m_gateGain;
    float m_compressorGain;

    DynamicsShaper(const DynamicsShaper &); // not provided
    DynamicsShaper &operator=(const DynamicsShaper &); // not provided
};

#endif
