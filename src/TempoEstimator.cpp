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

#include "TempoEstimator.h"

#include <algorithm>
#include <cmath>
#include <iostream>

using std::vector;
using std::cerr;
using std::endl;

static const double trackMinBpm = 30.0;
static const double trackMaxBpm = 300.0;
static const double priorStdOctaves = 1.0;

double
clampTempo(double bpm)
{
    if (bpm >= minimumTempo && bpm <= maximumTempo) {
        return bpm;
    }
    cerr << "clampTempo: tempo " << bpm << " outside [" << minimumTempo
         << ", " << maximumTempo << "], using " << defaultTempo << endl;
    return defaultTempo;
}

TempoEstimator::TempoEstimator(int sampleRate,
                               const TranscriptionParameters &params) :
    m_sampleRate(sampleRate),
    m_params(params)
{
}

TempoEstimator::~TempoEstimator()
{
}

double
TempoEstimator::track(const vector<double> &strength) const
{
    int n = int(strength.size());
    if (n < 2 || m_sampleRate <= 0) return 0.0;

    double mean = 0.0;
    for (int i = 0; i < n; ++i) mean += strength[i];
    mean /= n;

    vector<double> x(n);
    double energy = 0.0;
    for (int i = 0; i < n; ++i) {
        x[i] = strength[i] - mean;
        energy += x[i] * x[i];
    }
    if (energy <= 0.0) return 0.0;

    double framesPerMinute = 60.0 * m_sampleRate / m_params.hopSize;
    int minLag = std::max(1, int(floor(framesPerMinute / trackMaxBpm)));
    int maxLag = std::min(n - 1, int(ceil(framesPerMinute / trackMinBpm)));

    double bestScore = 0.0;
    int bestLag = 0;

    for (int lag = minLag; lag <= maxLag; ++lag) {
        double ac = 0.0;
        for (int i = 0; i + lag < n; ++i) {
            ac += x[i] * x[i + lag];
        }
        ac /= energy;
        double bpm = framesPerMinute / lag;
        double z = log2(bpm / defaultTempo) / priorStdOctaves;
        double score = ac * exp(-0.5 * z * z);
        if (score > bestScore) {
            bestScore = score;
            bestLag = lag;
        }
    }

    if (bestLag == 0) return 0.0;
    return framesPerMinute / bestLag;
}

double
TempoEstimator::estimate(const vector<double> &strength) const
{
    double bpm = 0.0;
    if (m_params.tempoOverride > 0.0) {
        bpm = m_params.tempoOverride;
    } else {
        bpm = track(strength);
    }
    double tempo = clampTempo(bpm);
    if (m_params.verbose) {
        cerr << "TempoEstimator::estimate: "
             << (m_params.tempoOverride > 0.0 ? "given" : "tracked")
             << " tempo " << bpm << ", using " << tempo << endl;
    }
    return tempo;
}
