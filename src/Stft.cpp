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

#include "Stft.h"

#include "constant-q-cpp/src/dsp/FFT.h"

#include <bqvec/VectorOps.h>

#include <cmath>

using std::vector;

using namespace breakfastquay;

Stft::Stft(int fftSize, int hopSize) :
    m_fftSize(fftSize),
    m_hopSize(hopSize),
    m_fft(new FFTReal(fftSize)),
    m_window(fftSize),
    m_inverseScale(1.0)
{
    for (int i = 0; i < m_fftSize; ++i) {
        m_window[i] = 0.5 - 0.5 * cos(2.0 * M_PI * i / m_fftSize);
    }

    // Not every FFT build normalises its inverse, so measure it
    // with an impulse rather than assume
    vector<double> ri(m_fftSize, 1.0), ii(m_fftSize, 0.0), ro(m_fftSize, 0.0);
    m_fft->inverse(ri.data(), ii.data(), ro.data());
    if (ro[0] != 0.0) {
        m_inverseScale = 1.0 / ro[0];
    }
}

Stft::~Stft()
{
    delete m_fft;
}

void
Stft::forward(const vector<float> &signal, Grid &mags, Grid &phases) const
{
    int length = int(signal.size());
    int frames = getFrameCount(length);
    int bins = getBinCount();
    int half = m_fftSize / 2;

    mags.assign(frames, vector<double>(bins, 0.0));
    phases.assign(frames, vector<double>(bins, 0.0));

    vector<double> frame(m_fftSize);
    vector<double> re(m_fftSize), im(m_fftSize);

    for (int f = 0; f < frames; ++f) {
        int start = f * m_hopSize - half;
        for (int i = 0; i < m_fftSize; ++i) {
            int ix = start + i;
            double v = (ix >= 0 && ix < length) ? signal[ix] : 0.0;
            frame[i] = v * m_window[i];
        }
        m_fft->forward(frame.data(), re.data(), im.data());
        v_cartesian_to_polar(mags[f].data(), phases[f].data(),
                             re.data(), im.data(), bins);
    }
}

Grid
Stft::magnitudes(const vector<float> &signal) const
{
    Grid mags, phases;
    forward(signal, mags, phases);
    return mags;
}

vector<float>
Stft::inverse(const Grid &mags, const Grid &phases, int length) const
{
    int frames = int(mags.size());
    int bins = getBinCount();
    int half = m_fftSize / 2;

    vector<double> out(length, 0.0);
    vector<double> norm(length, 0.0);

    vector<double> re(m_fftSize, 0.0), im(m_fftSize, 0.0);
    vector<double> frame(m_fftSize);

    for (int f = 0; f < frames; ++f) {
        v_polar_to_cartesian(re.data(), im.data(),
                             mags[f].data(), phases[f].data(), bins);
        m_fft->inverse(re.data(), im.data(), frame.data());
        int start = f * m_hopSize - half;
        for (int i = 0; i < m_fftSize; ++i) {
            int ix = start + i;
            if (ix < 0 || ix >= length) continue;
            out[ix] += frame[i] * m_inverseScale * m_window[i];
            norm[ix] += m_window[i] * m_window[i];
        }
    }

    vector<float> result(length, 0.f);
    for (int i = 0; i < length; ++i) {
        if (norm[i] > 1e-8) {
            result[i] = float(out[i] / norm[i]);
        }
    }
    return result;
}
