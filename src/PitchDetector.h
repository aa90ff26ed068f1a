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

#ifndef PIANOSCRIBE_PITCH_DETECTOR_H
#define PIANOSCRIBE_PITCH_DETECTOR_H

#include "NoteEvent.h"
#include "Segmenter.h"
#include "Stft.h"
#include "TranscriptionParameters.h"

#include <vector>

/**
 * Chord and note detection within onset segments. A constant-Q
 * spectrogram of the whole recording is computed once, with one bin
 * per semitone from the lowest piano pitch upward, and each column
 * normalised to unit maximum. Within a segment, a bin is reported as
 * a note if it is a sufficiently prominent spectral peak in most of
 * the segment's columns and, when harmonic refinement is on, it is
 * not explained as an overtone of a stronger lower note.
 */
class PitchDetector
{
public:
    PitchDetector(int sampleRate, const TranscriptionParameters &params);
    ~PitchDetector();

    /**
     * Compute the spectrogram of the given recording, replacing any
     * previous one. Throws AnalysisError if the sample rate cannot
     * accommodate the top bin.
     */
    void analyse(const std::vector<float> &samples);

    /**
     * Return the notes found in the given segment, ordered by pitch,
     * each spanning the segment. May be empty.
     */
    std::vector<NoteEvent> detect(const OnsetSegment &segment) const;

    std::vector<NoteEvent> detect(const std::vector<OnsetSegment> &segments) const;

    /// Columns are in time order; bins run from low to high pitch
    const Grid &getSpectrogram() const { return m_spectrogram; }

    double getColumnDuration() const { return m_columnDuration; }

    int getBinPitch(int bin) const;

    static double pitchToFrequency(double pitch);

    struct Candidate {
        Candidate() : bin(0), frequency(0.0), magnitude(0.0) { }
        Candidate(int b, double f, double m) :
            bin(b), frequency(f), magnitude(m) { }
        int bin;
        double frequency;
        double magnitude;       // mean over the segment
    };

    /**
     * Drop each candidate lying within toleranceCents of the 2nd to
     * maxHarmonic-th harmonic of a lower surviving candidate whose
     * magnitude exceeds its own by more than supportRatio. Returns
     * the survivors in ascending frequency order.
     */
    static std::vector<Candidate> suppressHarmonics(std::vector<Candidate> candidates,
                                                    double toleranceCents,
                                                    double supportRatio,
                                                    int maxHarmonic);

    /**
     * Return the indices of the local maxima of the column whose
     * topographic prominence is at least minProminence. End points
     * are never peaks; a flat-topped peak is reported at its middle.
     */
    static std::vector<int> findPeaks(const std::vector<double> &column,
                                      double minProminence);

    static double getProminence(const std::vector<double> &column, int peak);

    /**
     * Map a mean normalised magnitude to a MIDI velocity in [40, 127].
     */
    static int getVelocity(double magnitude);

private:
    int m_sampleRate;
    TranscriptionParameters m_params;
    Grid m_spectrogram;
    double m_columnDuration;

    PitchDetector(const PitchDetector &); // not provided
    PitchDetector &operator=(const PitchDetector &); // not provided
};

#endif
