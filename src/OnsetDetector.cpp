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

#include "OnsetDetector.h"
#include "Stft.h"

#include <algorithm>
#include <cmath>
#include <iostream>

using std::vector;
using std::cerr;
using std::endl;

static const double topDbRange = 80.0;
static const double powerFloor = 1e-10;

static const double preMaxSeconds = 0.03;
static const double avgSeconds = 0.1;
static const double waitSeconds = 0.03;
static const double peakDelta = 0.07;

// Slaney mel scale: linear to 1 kHz, logarithmic above
static const double melLinearStep = 200.0 / 3.0;
static const double melLogStartHz = 1000.0;
static const double melLogStep = log(6.4) / 27.0;

static double
hzToMel(double hz)
{
    if (hz < melLogStartHz) return hz / melLinearStep;
    return melLogStartHz / melLinearStep + log(hz / melLogStartHz) / melLogStep;
}

static double
melToHz(double mel)
{
    double logStart = melLogStartHz / melLinearStep;
    if (mel < logStart) return mel * melLinearStep;
    return melLogStartHz * exp(melLogStep * (mel - logStart));
}

const int OnsetDetector::melBands;

OnsetDetector::OnsetDetector(int sampleRate,
                             const TranscriptionParameters &params) :
    m_sampleRate(sampleRate),
    m_params(params)
{
    makeMelFilters();
}

OnsetDetector::~OnsetDetector()
{
}

void
OnsetDetector::makeMelFilters()
{
    int bins = m_params.fftSize / 2 + 1;
    double maxMel = hzToMel(m_sampleRate / 2.0);

    vector<double> edges(melBands + 2);
    for (int i = 0; i < melBands + 2; ++i) {
        edges[i] = melToHz(maxMel * i / (melBands + 1));
    }

    m_melFilters.assign(melBands, vector<double>(bins, 0.0));

    for (int m = 0; m < melBands; ++m) {
        double lo = edges[m], mid = edges[m+1], hi = edges[m+2];
        double norm = 2.0 / (hi - lo);
        for (int b = 0; b < bins; ++b) {
            double f = double(b) * m_sampleRate / m_params.fftSize;
            double w = 0.0;
            if (f > lo && f <= mid) w = (f - lo) / (mid - lo);
            else if (f > mid && f < hi) w = (hi - f) / (hi - mid);
            m_melFilters[m][b] = w * norm;
        }
    }
}

double
OnsetDetector::getFrameDuration() const
{
    return double(m_params.hopSize) / m_sampleRate;
}

vector<double>
OnsetDetector::getStrength(const vector<float> &signal) const
{
    if (signal.empty()) return vector<double>();

    Stft stft(m_params.fftSize, m_params.hopSize);
    Grid mags = stft.magnitudes(signal);

    int frames = int(mags.size());
    int bins = stft.getBinCount();

    Grid mel(frames, vector<double>(melBands, 0.0));
    double peakDb = -1e9;

    for (int f = 0; f < frames; ++f) {
        for (int m = 0; m < melBands; ++m) {
            const vector<double> &filter = m_melFilters[m];
            double power = 0.0;
            for (int b = 0; b < bins; ++b) {
                if (filter[b] == 0.0) continue;
                power += filter[b] * mags[f][b] * mags[f][b];
            }
            double db = 10.0 * log10(std::max(powerFloor, power));
            mel[f][m] = db;
            if (db > peakDb) peakDb = db;
        }
    }

    double floorDb = peakDb - topDbRange;

    vector<double> strength(frames, 0.0);
    for (int f = 1; f < frames; ++f) {
        double sum = 0.0;
        for (int m = 0; m < melBands; ++m) {
            double prev = std::max(floorDb, mel[f-1][m]);
            double curr = std::max(floorDb, mel[f][m]);
            if (curr > prev) sum += curr - prev;
        }
        strength[f] = sum / melBands;
    }

#ifdef DEBUG_ONSET_DETECTOR
    for (int f = 0; f < frames; ++f) {
        cerr << "OnsetDetector::getStrength: " << f << ": " << strength[f] << endl;
    }
#endif

    return strength;
}

vector<int>
OnsetDetector::peakPick(const vector<double> &x,
                        int preMax, int postMax,
                        int preAvg, int postAvg,
                        double delta, int wait)
{
    vector<int> peaks;
    int n = int(x.size());
    int previous = -wait - 1;

    for (int i = 0; i < n; ++i) {

        int lo = std::max(0, i - preMax);
        int hi = std::min(n, i + postMax);
        double mx = *std::max_element(x.begin() + lo, x.begin() + hi);
        if (x[i] != mx) continue;

        lo = std::max(0, i - preAvg);
        hi = std::min(n, i + postAvg);
        double mean = 0.0;
        for (int j = lo; j < hi; ++j) mean += x[j];
        mean /= (hi - lo);
        if (x[i] < mean + delta) continue;

        if (i - previous <= wait) continue;

        peaks.push_back(i);
        previous = i;
    }

    return peaks;
}

vector<int>
OnsetDetector::backtrack(const vector<int> &events, const vector<double> &curve)
{
    vector<int> minima;
    minima.push_back(0);
    for (int i = 1; i + 1 < int(curve.size()); ++i) {
        if (curve[i] <= curve[i-1] && curve[i] < curve[i+1]) {
            minima.push_back(i);
        }
    }

    vector<int> out;
    for (int i = 0; i < int(events.size()); ++i) {
        // last minimum at or before the event
        vector<int>::iterator it = std::upper_bound
            (minima.begin(), minima.end(), events[i]);
        --it;
        out.push_back(*it);
    }
    return out;
}

vector<int>
OnsetDetector::pickOnsets(const vector<double> &strength) const
{
    vector<double> x(strength);
    if (x.empty()) return vector<int>();

    for (int i = 0; i < int(x.size()); ++i) {
        if (x[i] < m_params.onsetThreshold) x[i] = 0.0;
    }

    double mn = *std::min_element(x.begin(), x.end());
    double mx = *std::max_element(x.begin(), x.end());
    if (mx - mn <= 0.0) {
        // nothing rises above the threshold
        return vector<int>();
    }
    for (int i = 0; i < int(x.size()); ++i) {
        x[i] = (x[i] - mn) / (mx - mn);
    }

    double frame = getFrameDuration();
    int preMax = int(preMaxSeconds / frame);
    int avg = int(avgSeconds / frame);
    int wait = int(waitSeconds / frame);

    vector<int> peaks = peakPick(x, preMax, 1, avg, avg + 1, peakDelta, wait);
    vector<int> onsets = backtrack(peaks, x);

    std::sort(onsets.begin(), onsets.end());
    onsets.erase(std::unique(onsets.begin(), onsets.end()), onsets.end());

    if (m_params.verbose) {
        cerr << "OnsetDetector::pickOnsets: " << peaks.size()
             << " peaks, " << onsets.size() << " onsets after backtracking"
             << endl;
    }

    return onsets;
}

vector<double>
OnsetDetector::pickOnsetTimes(const vector<double> &strength) const
{
    vector<int> frames = pickOnsets(strength);
    vector<double> times;
    double frame = getFrameDuration();
    for (int i = 0; i < int(frames.size()); ++i) {
        times.push_back(frames[i] * frame);
    }
    return times;
}
