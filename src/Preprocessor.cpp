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

#include "Preprocessor.h"

#include "DynamicsShaper.h"
#include "Filters.h"
#include "SpectralProcessors.h"

#include <bqvec/VectorOps.h>

#include <algorithm>
#include <cmath>
#include <iostream>

using std::vector;
using std::cerr;
using std::endl;

using namespace breakfastquay;

static const int bandPassOrder = 4;

Preprocessor::Preprocessor(const TranscriptionParameters &params) :
    m_params(params)
{
}

Preprocessor::~Preprocessor()
{
}

void
Preprocessor::normalise(vector<float> &samples)
{
    if (samples.empty()) return;
    float peak = 0.f;
    for (int i = 0; i < int(samples.size()); ++i) {
        float a = fabsf(samples[i]);
        if (a > peak) peak = a;
    }
    if (peak > 0.f) {
        v_scale(samples.data(), 1.f / peak, int(samples.size()));
    }
}

AudioBuffer
Preprocessor::process(const AudioBuffer &in) const
{
    AudioBuffer out(in.samples, in.sampleRate);
    if (out.empty()) return out;

    int n = int(out.samples.size());
    int rate = out.sampleRate;

    normalise(out.samples);

    NoiseReducer reducer(rate, m_params.fftSize, m_params.hopSize,
                         m_params.noiseReduction);
    out.samples = reducer.process(out.samples);

    DynamicsShaper shaper(rate, m_params);
    shaper.process(out.samples.data(), out.samples.data(), n);

    HarmonicSeparator separator(m_params.fftSize, m_params.hopSize,
                                m_params.separationMargin);
    out.samples = separator.process(out.samples);

    // The band edges must sit below Nyquist for the design to hold
    double high = std::min(double(m_params.bandHigh), rate * 0.45);
    double low = std::min(double(m_params.bandLow), high * 0.5);
    ButterworthBandPass band(rate, low, high, bandPassOrder);
    out.samples = band.filtfilt(out.samples);

    if (m_params.verbose) {
        float peak = 0.f;
        for (int i = 0; i < n; ++i) {
            if (fabsf(out.samples[i]) > peak) peak = fabsf(out.samples[i]);
        }
        cerr << "Preprocessor::process: " << n << " samples at " << rate
             << " Hz, output peak " << peak << endl;
    }

    return out;
}
