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

#include "PitchDetector.h"
#include "TranscriptionErrors.h"

#include <cq/CQSpectrogram.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

using std::vector;
using std::cerr;
using std::endl;

static const int lowestPianoPitch = 21;
static const int highestPianoPitch = 108;

PitchDetector::PitchDetector(int sampleRate,
                             const TranscriptionParameters &params) :
    m_sampleRate(sampleRate),
    m_params(params),
    m_columnDuration(0.0)
{
}

PitchDetector::~PitchDetector()
{
}

double
PitchDetector::pitchToFrequency(double pitch)
{
    return 440.0 * pow(2.0, (pitch - 69.0) / 12.0);
}

int
PitchDetector::getBinPitch(int bin) const
{
    return m_params.lowestPitch +
        int(round(bin * 12.0 / m_params.binsPerOctave));
}

int
PitchDetector::getVelocity(double magnitude)
{
    int v = int(round(40.0 + magnitude * 100.0));
    if (v < 40) v = 40;
    if (v > 127) v = 127;
    return v;
}

void
PitchDetector::analyse(const vector<float> &samples)
{
    m_spectrogram.clear();

    int bins = m_params.binsPerOctave * m_params.octaves;
    double minFreq = pitchToFrequency(m_params.lowestPitch);
    double maxFreq = minFreq * pow(2.0, double(bins - 1) / m_params.binsPerOctave);

    if (maxFreq >= m_sampleRate / 2.0) {
        std::ostringstream os;
        os << "PitchDetector::analyse: sample rate " << m_sampleRate
           << " too low for a top bin at " << maxFreq << " Hz";
        throw AnalysisError(os.str());
    }

    CQParameters params(m_sampleRate, minFreq, maxFreq, m_params.binsPerOctave);
    params.window = CQParameters::Hann;

    CQSpectrogram cq(params, CQSpectrogram::InterpolateLinear);

    int hop = cq.getColumnHop();
    m_columnDuration = double(hop) / m_sampleRate;

    if (samples.empty()) return;

    vector<double> data(samples.begin(), samples.end());
    Grid raw = cq.process(data);
    Grid remaining = cq.getRemainingOutput();
    raw.insert(raw.end(), remaining.begin(), remaining.end());

    int latentColumns = cq.getLatency() / hop;
    int total = cq.getTotalBins();

    for (int i = latentColumns; i < int(raw.size()); ++i) {

        // The transform has the high frequencies first
        const vector<double> &in = raw[i];
        vector<double> col(bins, 0.0);
        for (int j = 0; j < bins && j < total && j < int(in.size()); ++j) {
            col[j] = in[total - j - 1];
        }

        double mx = *std::max_element(col.begin(), col.end());
        if (mx > 0.0) {
            for (int j = 0; j < bins; ++j) col[j] /= mx;
        }

        m_spectrogram.push_back(col);
    }

    if (m_params.verbose) {
        cerr << "PitchDetector::analyse: " << m_spectrogram.size()
             << " columns of " << bins << " bins, column hop " << hop
             << ", latency " << cq.getLatency() << endl;
    }
}

double
PitchDetector::getProminence(const vector<double> &x, int peak)
{
    int n = int(x.size());
    double h = x[peak];

    double leftMin = h;
    for (int i = peak - 1; i >= 0; --i) {
        if (x[i] > h) break;
        if (x[i] < leftMin) leftMin = x[i];
    }

    double rightMin = h;
    for (int i = peak + 1; i < n; ++i) {
        if (x[i] > h) break;
        if (x[i] < rightMin) rightMin = x[i];
    }

    return h - std::max(leftMin, rightMin);
}

vector<int>
PitchDetector::findPeaks(const vector<double> &x, double minProminence)
{
    vector<int> peaks;
    int n = int(x.size());
    int i = 1;

    while (i < n - 1) {
        if (x[i-1] < x[i]) {
            int ahead = i + 1;
            while (ahead < n - 1 && x[ahead] == x[i]) ++ahead;
            if (x[ahead] < x[i]) {
                int peak = (i + ahead - 1) / 2;
                if (getProminence(x, peak) >= minProminence) {
                    peaks.push_back(peak);
                }
                i = ahead;
                continue;
            }
        }
        ++i;
    }

    return peaks;
}

vector<PitchDetector::Candidate>
PitchDetector::suppressHarmonics(vector<Candidate> candidates,
                                 double toleranceCents,
                                 double supportRatio,
                                 int maxHarmonic)
{
    struct ByFrequency {
        bool operator()(const Candidate &a, const Candidate &b) const {
            return a.frequency < b.frequency;
        }
    };
    std::sort(candidates.begin(), candidates.end(), ByFrequency());

    vector<Candidate> survivors;

    for (int i = 0; i < int(candidates.size()); ++i) {

        const Candidate &c = candidates[i];
        bool overtone = false;

        for (int j = 0; j < int(survivors.size()); ++j) {

            const Candidate &lower = survivors[j];
            if (lower.frequency <= 0.0) continue;

            double ratio = c.frequency / lower.frequency;
            int k = int(round(ratio));
            if (k < 2 || k > maxHarmonic) continue;

            double cents = 1200.0 * log2(ratio / k);
            if (fabs(cents) > toleranceCents) continue;

            if (lower.magnitude > supportRatio * c.magnitude) {
#ifdef DEBUG_PITCH_DETECTOR
                cerr << "PitchDetector::suppressHarmonics: " << c.frequency
                     << " Hz is harmonic " << k << " of " << lower.frequency
                     << " Hz" << endl;
#endif
                overtone = true;
                break;
            }
        }

        if (!overtone) survivors.push_back(c);
    }

    return survivors;
}

vector<NoteEvent>
PitchDetector::detect(const OnsetSegment &segment) const
{
    vector<NoteEvent> notes;
    if (m_spectrogram.empty() || m_columnDuration <= 0.0) return notes;

    int columns = int(m_spectrogram.size());
    int first = int(ceil(segment.start / m_columnDuration));
    int last = int(ceil(segment.end / m_columnDuration)); // exclusive
    if (first >= columns) return notes;
    if (last > columns) last = columns;
    if (last <= first) last = first + 1;

    int frames = last - first;
    int bins = int(m_spectrogram[first].size());

    vector<int> peakCounts(bins, 0);
    vector<double> means(bins, 0.0);

    for (int c = first; c < last; ++c) {
        const vector<double> &col = m_spectrogram[c];
        vector<int> peaks = findPeaks(col, m_params.peakProminence);
        for (int j = 0; j < int(peaks.size()); ++j) {
            ++peakCounts[peaks[j]];
        }
        for (int b = 0; b < bins; ++b) {
            means[b] += col[b];
        }
    }

    vector<Candidate> candidates;
    for (int b = 0; b < bins; ++b) {
        means[b] /= frames;
        if (peakCounts[b] > m_params.persistence * frames) {
            candidates.push_back(Candidate(b, pitchToFrequency(getBinPitch(b)),
                                           means[b]));
        }
    }

    if (m_params.harmonicRefinement) {
        candidates = suppressHarmonics(candidates,
                                       m_params.harmonicToleranceCents,
                                       m_params.harmonicSupportRatio,
                                       m_params.maxHarmonic);
    }

    if (m_params.singlePitch && candidates.size() > 1) {
        int loudest = 0;
        for (int i = 1; i < int(candidates.size()); ++i) {
            if (candidates[i].magnitude > candidates[loudest].magnitude) {
                loudest = i;
            }
        }
        candidates = vector<Candidate>(1, candidates[loudest]);
    }

    for (int i = 0; i < int(candidates.size()); ++i) {
        int pitch = getBinPitch(candidates[i].bin);
        if (pitch < lowestPianoPitch || pitch > highestPianoPitch) continue;
        notes.push_back(NoteEvent(pitch, getVelocity(candidates[i].magnitude),
                                  segment.start, segment.end));
    }

    std::sort(notes.begin(), notes.end());
    return notes;
}

vector<NoteEvent>
PitchDetector::detect(const vector<OnsetSegment> &segments) const
{
    vector<NoteEvent> notes;
    int empty = 0;
    for (int i = 0; i < int(segments.size()); ++i) {
        vector<NoteEvent> found = detect(segments[i]);
        if (found.empty()) ++empty;
        notes.insert(notes.end(), found.begin(), found.end());
    }
    if (m_params.verbose) {
        cerr << "PitchDetector::detect: " << notes.size() << " notes in "
             << segments.size() << " segments (" << empty
             << " with no pitch)" << endl;
    }
    return notes;
}
