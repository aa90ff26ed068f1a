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

#include "DynamicsShaper.h"
#include "TranscriptionParameters.h"

#include <cmath>

const float detectorSeconds = 0.01f;
const float attackSeconds = 0.001f;
const float compressorReleaseSeconds = 0.1f;
const float shelfQ = 1.f;
const float floorDb = -120.f;

static float
smoothingCoefficient(float seconds, int sampleRate)
{
    return expf(-1.f / (seconds * sampleRate));
}

static float
toDb(float v)
{
    if (v <= 0.f) return floorDb;
    float db = 20.f * log10f(v);
    return db < floorDb ? floorDb : db;
}

DynamicsShaper::DynamicsShaper(int sampleRate,
                               const TranscriptionParameters &params) :
    m_sampleRate(sampleRate),
    m_gateThresholdDb(params.gateThresholdDb),
    m_gateRatio(params.gateRatio),
    m_compressorThresholdDb(params.compressorThresholdDb),
    m_compressorRatio(params.compressorRatio),
    m_makeup(powf(10.f, params.makeupGainDb / 20.f)),
    m_attack(smoothingCoefficient(attackSeconds, sampleRate)),
    m_gateRelease(smoothingCoefficient(params.gateReleaseMs / 1000.f,
                                       sampleRate)),
    m_compressorRelease(smoothingCoefficient(compressorReleaseSeconds,
                                             sampleRate)),
    m_shelf(Biquad::lowShelf(sampleRate, params.lowShelfFrequency,
                             params.lowShelfGainDb, shelfQ)),
    m_history(0),
    m_histlen(0),
    m_histwrite(0),
    m_histread(0),
    m_sumOfSquares(0.0),
    m_rms(0.f),
    m_gateGain(1.f),
    m_compressorGain(1.f)
{
    reset();
}

DynamicsShaper::~DynamicsShaper()
{
    delete[] m_history;
}

void
DynamicsShaper::reset()
{
    delete[] m_history;
    m_histlen = int(round(m_sampleRate * detectorSeconds));
    if (m_histlen < 2) m_histlen = 2;
    m_history = new float[m_histlen];
    for (int i = 0; i < m_histlen; ++i) {
        m_history[i] = 0.f;
    }
    m_histwrite = 0;
    m_histread = 0;

    m_sumOfSquares = 0.0;
    m_rms = 0.f;
    m_gateGain = 1.f;
    m_compressorGain = 1.f;
    m_shelf.reset();
}

void
DynamicsShaper::process(const float *in, float *out, int n)
{
    for (int i = 0; i < n; ++i) {
        out[i] = processSingle(in[i]);
    }
}

float
DynamicsShaper::processSingle(float f)
{
    updateRMS(f);

    float level = toDb(m_rms);

    // Gate: below threshold, expand downwards by the ratio
    float gateTargetDb = 0.f;
    if (level < m_gateThresholdDb) {
        gateTargetDb = (level - m_gateThresholdDb) * (m_gateRatio - 1.f);
    }
    float gateTarget = powf(10.f, gateTargetDb / 20.f);
    float c = (gateTarget < m_gateGain ? m_gateRelease : m_attack);
    m_gateGain = gateTarget + (m_gateGain - gateTarget) * c;

    // Compressor sees the gated level
    float gated = level + toDb(m_gateGain);
    float compTargetDb = 0.f;
    if (gated > m_compressorThresholdDb) {
        compTargetDb = -(gated - m_compressorThresholdDb) *
            (1.f - 1.f / m_compressorRatio);
    }
    float compTarget = powf(10.f, compTargetDb / 20.f);
    c = (compTarget < m_compressorGain ? m_attack : m_compressorRelease);
    m_compressorGain = compTarget + (m_compressorGain - compTarget) * c;

    double shaped = m_shelf.process(double(f) * m_gateGain * m_compressorGain);

    return float(shaped * m_makeup);
}

void
DynamicsShaper::updateRMS(float f)
{
    // Sum of the squares of the last n samples, kept with a circular
    // history: the oldest sample's square leaves as the newest enters

    int nextWrite = (m_histwrite + 1) % m_histlen;

    float lose = 0.f;

    if (nextWrite == m_histread) {
        // full
        lose = m_history[m_histread];
        m_histread = (m_histread + 1) % m_histlen;
    }

    m_history[m_histwrite] = f;
    m_histwrite = nextWrite;

    int fill = (m_histwrite - m_histread + m_histlen) % m_histlen;

    m_sumOfSquares -= lose * lose;
    m_sumOfSquares += f * f;
    if (m_sumOfSquares < 0.0) m_sumOfSquares = 0.0;

    m_rms = float(sqrt(m_sumOfSquares / fill));
}
