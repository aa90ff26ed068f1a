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

#include "SpectralProcessors.h"

#include "constant-q-cpp/src/dsp/MedianFilter.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

using std::vector;

static const double stationaryStdThreshold = 1.5;
static const double maskSmoothHz = 500.0;
static const double maskSmoothSeconds = 0.05;
static const double dbFloor = -200.0;

NoiseReducer::NoiseReducer(int sampleRate, int fftSize, int hopSize,
                           float reduction) :
    m_sampleRate(sampleRate),
    m_stft(fftSize, hopSize),
    m_reduction(reduction)
{
}

static vector<double>
triangle(int halfWidth)
{
    // Symmetric triangular kernel of 2 * halfWidth + 1 taps, unit sum
    vector<double> k(2 * halfWidth + 1);
    double sum = 0.0;
    for (int i = 0; i <= 2 * halfWidth; ++i) {
        k[i] = halfWidth + 1 - abs(i - halfWidth);
        sum += k[i];
    }
    for (int i = 0; i < int(k.size()); ++i) k[i] /= sum;
    return k;
}

vector<float>
NoiseReducer::process(const vector<float> &signal) const
{
    if (signal.empty() || m_reduction <= 0.f) return signal;

    Grid mags, phases;
    m_stft.forward(signal, mags, phases);

    int frames = int(mags.size());
    int bins = m_stft.getBinCount();

    vector<double> mean(bins, 0.0), sd(bins, 0.0);
    Grid db(frames, vector<double>(bins));

    for (int f = 0; f < frames; ++f) {
        for (int b = 0; b < bins; ++b) {
            double m = mags[f][b];
            db[f][b] = (m > 0.0 ? std::max(dbFloor, 20.0 * log10(m)) : dbFloor);
            mean[b] += db[f][b];
        }
    }
    for (int b = 0; b < bins; ++b) mean[b] /= frames;
    for (int f = 0; f < frames; ++f) {
        for (int b = 0; b < bins; ++b) {
            double d = db[f][b] - mean[b];
            sd[b] += d * d;
        }
    }
    for (int b = 0; b < bins; ++b) sd[b] = sqrt(sd[b] / frames);

    Grid mask(frames, vector<double>(bins, 0.0));
    for (int f = 0; f < frames; ++f) {
        for (int b = 0; b < bins; ++b) {
            double threshold = mean[b] + stationaryStdThreshold * sd[b];
            mask[f][b] = (db[f][b] > threshold ? 1.0 : 0.0);
        }
    }

    double binHz = double(m_sampleRate) / m_stft.getFftSize();
    double frameSeconds = double(m_stft.getHopSize()) / m_sampleRate;
    vector<double> fk = triangle(std::max(1, int(maskSmoothHz / binHz / 2)));
    vector<double> tk = triangle(std::max(1, int(maskSmoothSeconds / frameSeconds / 2)));
    int fh = int(fk.size()) / 2, th = int(tk.size()) / 2;

    Grid smoothed(frames, vector<double>(bins, 0.0));
    for (int f = 0; f < frames; ++f) {
        for (int b = 0; b < bins; ++b) {
            double acc = 0.0;
            for (int i = -fh; i <= fh; ++i) {
                int bb = b + i;
                if (bb < 0 || bb >= bins) continue;
                acc += fk[i + fh] * mask[f][bb];
            }
            smoothed[f][b] = acc;
        }
    }
    for (int f = 0; f < frames; ++f) {
        for (int b = 0; b < bins; ++b) {
            double acc = 0.0;
            for (int i = -th; i <= th; ++i) {
                int ff = f + i;
                if (ff < 0 || ff >= frames) continue;
                acc += tk[i + th] * smoothed[ff][b];
            }
            double gain = acc * m_reduction + (1.0 - m_reduction);
            mags[f][b] *= gain;
        }
    }

    return m_stft.inverse(mags, phases, int(signal.size()));
}

HarmonicSeparator::HarmonicSeparator(int fftSize, int hopSize, float margin) :
    m_stft(fftSize, hopSize),
    m_margin(margin)
{
}

vector<float>
HarmonicSeparator::process(const vector<float> &signal) const
{
    if (signal.empty()) return signal;

    Grid mags, phases;
    m_stft.forward(signal, mags, phases);

    int frames = int(mags.size());
    int bins = m_stft.getBinCount();

    // Harmonic estimate: median along time, bin by bin
    Grid harmonic(frames, vector<double>(bins, 0.0));
    vector<double> row(frames);
    for (int b = 0; b < bins; ++b) {
        for (int f = 0; f < frames; ++f) row[f] = mags[f][b];
        vector<double> filtered = MedianFilter<double>::filter(kernelSize, row);
        for (int f = 0; f < frames; ++f) harmonic[f][b] = filtered[f];
    }

    for (int f = 0; f < frames; ++f) {

        // Percussive estimate: median along frequency
        vector<double> percussive = MedianFilter<double>::filter(kernelSize, mags[f]);

        for (int b = 0; b < bins; ++b) {
            double h = harmonic[f][b];
            double p = percussive[b] * m_margin;
            double h2 = h * h, p2 = p * p;
            double mask = (h2 + p2 > 0.0 ? h2 / (h2 + p2) : 0.0);
            mags[f][b] *= mask;
        }
    }

    return m_stft.inverse(mags, phases, int(signal.size()));
}
