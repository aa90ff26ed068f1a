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

#include "TranscriptionParameters.h"

#include <sstream>

using std::string;
using std::vector;

TranscriptionParameters::TranscriptionParameters() :
    targetSampleRate(44100),
    hopSize(512),
    fftSize(2048),
    preprocess(true),
    noiseReduction(0.85f),
    gateThresholdDb(-40.f),
    gateRatio(2.f),
    gateReleaseMs(250.f),
    compressorThresholdDb(-20.f),
    compressorRatio(4.f),
    lowShelfFrequency(300.f),
    lowShelfGainDb(6.f),
    makeupGainDb(3.f),
    separationMargin(3.f),
    bandLow(25.f),
    bandHigh(4200.f),
    tempoOverride(0.0),
    onsetThreshold(0.85f),
    noiseFloorMultiplier(2.f),
    noiseFloorPercentile(10.f),
    fallbackSegmentSeconds(0.5),
    lowestPitch(21),
    binsPerOctave(12),
    octaves(7),
    peakProminence(0.1f),
    persistence(0.7f),
    harmonicRefinement(true),
    harmonicToleranceCents(50.f),
    harmonicSupportRatio(1.5f),
    maxHarmonic(5),
    singlePitch(false),
    ticksPerQuarter(480),
    stepsPerQuarter(4),
    staffSplitPitch(60),
    minimumRestSteps(1),
    padFinalMeasure(true),
    combineRests(true),
    verbose(false)
{
}

vector<string>
TranscriptionParameters::validate() const
{
    vector<string> problems;

    if (targetSampleRate <= 0) {
        problems.push_back("target sample rate must be positive");
    }
    if (hopSize <= 0 || fftSize <= 0 || fftSize < hopSize) {
        problems.push_back("hop and FFT sizes must be positive, with FFT size at least the hop");
    }
    if (fftSize > 0 && (fftSize & (fftSize - 1)) != 0) {
        problems.push_back("FFT size must be a power of two");
    }
    if (noiseReduction < 0.f || noiseReduction > 1.f) {
        problems.push_back("noise reduction must lie in [0,1]");
    }
    if (bandLow <= 0.f || bandHigh <= bandLow ||
        bandHigh >= targetSampleRate / 2.f) {
        std::ostringstream os;
        os << "band-pass edges " << bandLow << ".." << bandHigh
           << " Hz are not usable at " << targetSampleRate << " Hz";
        problems.push_back(os.str());
    }
    if (onsetThreshold < 0.f || peakProminence < 0.f) {
        problems.push_back("thresholds must not be negative");
    }
    if (noiseFloorPercentile < 0.f || noiseFloorPercentile > 100.f) {
        problems.push_back("noise floor percentile must lie in [0,100]");
    }
    if (persistence <= 0.f || persistence > 1.f) {
        problems.push_back("persistence must lie in (0,1]");
    }
    if (harmonicSupportRatio <= 1.f) {
        problems.push_back("harmonic support ratio must exceed 1");
    }
    if (maxHarmonic < 2) {
        problems.push_back("at least the second harmonic must be considered");
    }
    if (lowestPitch < 0 || lowestPitch + octaves * 12 - 1 > 127 ||
        binsPerOctave != 12 || octaves < 1) {
        problems.push_back("transform must have 12 bins per octave within the MIDI range");
    }
    if (ticksPerQuarter <= 0 || stepsPerQuarter <= 0 ||
        ticksPerQuarter % stepsPerQuarter != 0) {
        problems.push_back("grid steps must divide the ticks per quarter");
    }
    if (stepsPerQuarter != 4) {
        problems.push_back("only a sixteenth-note grid is supported");
    }
    if (staffSplitPitch < 0 || staffSplitPitch > 127) {
        problems.push_back("staff split pitch must be a MIDI pitch");
    }
    if (minimumRestSteps < 1) {
        problems.push_back("minimum rest must be at least one grid step");
    }

    return problems;
}
