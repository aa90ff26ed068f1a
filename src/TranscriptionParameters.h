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

#ifndef PIANOSCRIBE_TRANSCRIPTION_PARAMETERS_H
#define PIANOSCRIBE_TRANSCRIPTION_PARAMETERS_H

#include <string>
#include <vector>

/**
 * Every tunable of the transcription pipeline in one place. The
 * defaults are the values the pipeline is tuned for; the command
 * line tool and the plugin parameters both write into this.
 */
struct TranscriptionParameters
{
    TranscriptionParameters();

    // Decoding
    int targetSampleRate;

    // Analysis framing
    int hopSize;                // samples per analysis frame
    int fftSize;

    // Preprocessor
    bool preprocess;
    float noiseReduction;       // proportion of the noise floor removed
    float gateThresholdDb;
    float gateRatio;
    float gateReleaseMs;
    float compressorThresholdDb;
    float compressorRatio;
    float lowShelfFrequency;
    float lowShelfGainDb;
    float makeupGainDb;
    float separationMargin;     // harmonic/percussive mask margin
    float bandLow;
    float bandHigh;

    // Tempo
    double tempoOverride;       // used instead of beat tracking if > 0

    // Segmenter
    float onsetThreshold;
    float noiseFloorMultiplier;
    float noiseFloorPercentile;
    double fallbackSegmentSeconds;

    // PitchDetector
    int lowestPitch;            // MIDI pitch of the lowest transform bin
    int binsPerOctave;
    int octaves;
    float peakProminence;
    float persistence;          // fraction of frames a peak must survive
    bool harmonicRefinement;
    float harmonicToleranceCents;
    float harmonicSupportRatio;
    int maxHarmonic;
    bool singlePitch;

    // Quantizer
    int ticksPerQuarter;
    int stepsPerQuarter;

    // NotationBuilder / RestCombiner
    int staffSplitPitch;
    int minimumRestSteps;
    bool padFinalMeasure;
    bool combineRests;

    bool verbose;

    /**
     * Return a description of each inconsistent value, or an empty
     * list if the set is usable.
     */
    std::vector<std::string> validate() const;
};

#endif
