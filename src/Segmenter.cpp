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

#include "Segmenter.h"
#include "OnsetDetector.h"
#include "TempoEstimator.h"

#include <algorithm>
#include <cmath>
#include <iostream>

using std::vector;
using std::cerr;
using std::endl;

static const int minimumSilenceRun = 3;
static const int maximumSilenceRun = 20;

// The floor never rises above this proportion of the median frame
// level, so material with no quiet frames still has frames above it
static const double floorCeilingRatio = 0.5;

Segmenter::Segmenter(int sampleRate, const TranscriptionParameters &params,
                     double tempo) :
    m_sampleRate(sampleRate),
    m_params(params),
    m_tempo(clampTempo(tempo)),
    m_rejected(0)
{
}

Segmenter::~Segmenter()
{
}

int
Segmenter::getSilenceRunFrames() const
{
    double frame = double(m_params.hopSize) / m_sampleRate;
    int run = int(round(sixteenthDuration(m_tempo) / frame));
    if (run < minimumSilenceRun) run = minimumSilenceRun;
    if (run > maximumSilenceRun) run = maximumSilenceRun;
    return run;
}

int
Segmenter::getMinimumFrames() const
{
    double frame = double(m_params.hopSize) / m_sampleRate;
    int frames = int(round(0.5 * sixteenthDuration(m_tempo) / frame));
    return std::max(1, frames);
}

vector<double>
Segmenter::getFrameLevels(const vector<float> &samples) const
{
    int n = int(samples.size());
    int hop = m_params.hopSize;
    int half = m_params.fftSize / 2;
    int frames = 1 + n / hop;

    vector<double> levels(frames, 0.0);
    for (int f = 0; f < frames; ++f) {
        int centre = f * hop;
        double sum = 0.0;
        for (int i = centre - half; i < centre + half; ++i) {
            if (i < 0 || i >= n) continue;
            sum += double(samples[i]) * samples[i];
        }
        levels[f] = sqrt(sum / m_params.fftSize);
    }
    return levels;
}

double
Segmenter::getNoiseFloor(const vector<double> &levels) const
{
    if (levels.empty()) return 0.0;
    vector<double> sorted(levels);
    std::sort(sorted.begin(), sorted.end());

    // Linear interpolation between closest ranks
    double pos = (m_params.noiseFloorPercentile / 100.0) * (sorted.size() - 1);
    int lo = int(floor(pos));
    int hi = std::min(int(sorted.size()) - 1, lo + 1);
    double frac = pos - lo;
    double p = sorted[lo] + frac * (sorted[hi] - sorted[lo]);

    int n = int(sorted.size());
    double median = (n % 2 ? sorted[n/2] : 0.5 * (sorted[n/2 - 1] + sorted[n/2]));

    return std::min(m_params.noiseFloorMultiplier * p,
                    floorCeilingRatio * median);
}

vector<double>
Segmenter::findBoundaries(const vector<double> &strength,
                          double duration) const
{
    OnsetDetector detector(m_sampleRate, m_params);
    vector<double> onsets = detector.pickOnsetTimes(strength);

    vector<double> boundaries;
    for (int i = 0; i < int(onsets.size()); ++i) {
        if (onsets[i] < duration) boundaries.push_back(onsets[i]);
    }

    if (boundaries.empty()) {
        if (m_params.verbose) {
            cerr << "Segmenter::findBoundaries: no onsets found, using "
                 << m_params.fallbackSegmentSeconds << "s segments" << endl;
        }
        double step = m_params.fallbackSegmentSeconds;
        for (int i = 0; i * step < duration; ++i) {
            boundaries.push_back(i * step);
        }
    }

    boundaries.push_back(duration);
    return boundaries;
}

vector<OnsetSegment>
Segmenter::segment(const AudioBuffer &buffer,
                   const vector<double> &boundaries) const
{
    vector<OnsetSegment> segments;
    m_rejected = 0;

    if (buffer.empty() || boundaries.size() < 2) return segments;

    vector<double> levels = getFrameLevels(buffer.samples);
    double noiseFloor = getNoiseFloor(levels);
    int frameCount = int(levels.size());
    double frame = double(m_params.hopSize) / buffer.sampleRate;

    int run = getSilenceRunFrames();
    int minFrames = getMinimumFrames();

    for (int i = 0; i + 1 < int(boundaries.size()); ++i) {

        int startFrame = int(round(boundaries[i] / frame));
        int nominalEnd = int(round(boundaries[i+1] / frame));
        if (startFrame >= frameCount) {
            ++m_rejected;
            continue;
        }
        if (nominalEnd > frameCount) nominalEnd = frameCount;

        int endFrame = nominalEnd;
        int quiet = 0;
        for (int f = startFrame; f < nominalEnd; ++f) {
            if (levels[f] <= noiseFloor) {
                if (++quiet == run) {
                    endFrame = f - run + 1;
                    break;
                }
            } else {
                quiet = 0;
            }
        }

        // A segment always keeps at least its first frame
        if (endFrame < startFrame + 1) endFrame = startFrame + 1;

        if (endFrame - startFrame < minFrames) {
#ifdef DEBUG_SEGMENTER
            cerr << "Segmenter::segment: segment at " << boundaries[i]
                 << " too short (" << endFrame - startFrame << " frames)"
                 << endl;
#endif
            ++m_rejected;
            continue;
        }

        double mean = 0.0;
        for (int f = startFrame; f < endFrame; ++f) mean += levels[f];
        mean /= (endFrame - startFrame);

        if (mean <= noiseFloor) {
#ifdef DEBUG_SEGMENTER
            cerr << "Segmenter::segment: segment at " << boundaries[i]
                 << " too quiet (" << mean << " <= " << noiseFloor << ")" << endl;
#endif
            ++m_rejected;
            continue;
        }

        double start = startFrame * frame;
        double end = std::min(endFrame * frame, boundaries[i+1]);
        if (end < start + frame) end = start + frame;

        segments.push_back(OnsetSegment(start, end));
    }

    if (m_params.verbose) {
        cerr << "Segmenter::segment: " << segments.size() << " of "
             << boundaries.size() - 1 << " segments accepted, noise floor "
             << noiseFloor << endl;
    }

    return segments;
}
