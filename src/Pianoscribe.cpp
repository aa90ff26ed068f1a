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

#include "Pianoscribe.h"

#include "AudioBuffer.h"
#include "PitchDetector.h"
#include "ScoreModel.h"
#include "Transcriber.h"

#include <cmath>
#include <iostream>
#include <stdexcept>

using std::vector;
using std::cerr;
using std::endl;

using Vamp::RealTime;

static int minInputSampleRate = 100;
static int maxInputSampleRate = 192000;

Pianoscribe::Pianoscribe(float inputSampleRate) :
    Plugin(inputSampleRate),
    m_blockSize(0),
    m_haveStartTime(false),
    m_notesOutputNo(-1),
    m_quantisedOutputNo(-1),
    m_onsetsOutputNo(-1),
    m_tempoOutputNo(-1)
{
}

Pianoscribe::~Pianoscribe()
{
}

string
Pianoscribe::getIdentifier() const
{
    return "pianoscribe";
}

string
Pianoscribe::getName() const
{
    return "Pianoscribe Piano Transcription";
}

string
Pianoscribe::getDescription() const
{
    return "Estimate the notes and chords of a solo piano recording, with their timings snapped to a sixteenth-note grid at the estimated tempo.";
}

string
Pianoscribe::getMaker() const
{
    return "Pianoscribe";
}

int
Pianoscribe::getPluginVersion() const
{
    return 1;
}

string
Pianoscribe::getCopyright() const
{
    return "GPL licence.";
}

Pianoscribe::InputDomain
Pianoscribe::getInputDomain() const
{
    return TimeDomain;
}

size_t
Pianoscribe::getPreferredBlockSize() const
{
    return 0;
}

size_t 
Pianoscribe::getPreferredStepSize() const
{
    return 0;
}

size_t
Pianoscribe::getMinChannelCount() const
{
    return 1;
}

size_t
Pianoscribe::getMaxChannelCount() const
{
    return 1;
}

Pianoscribe::ParameterList
Pianoscribe::getParameterDescriptors() const
{
    ParameterList list;
    TranscriptionParameters defaults;

    ParameterDescriptor desc;
    desc.identifier = "harmonic";
    desc.name = "Suppress overtones";
    desc.unit = "";
    desc.description = "Discard detected pitches that lie on a harmonic of a stronger lower pitch in the same chord.";
    desc.minValue = 0;
    desc.maxValue = 1;
    desc.defaultValue = defaults.harmonicRefinement ? 1 : 0;
    desc.isQuantized = true;
    desc.quantizeStep = 1;
    list.push_back(desc);

    desc.identifier = "supportratio";
    desc.name = "Overtone support ratio";
    desc.unit = "";
    desc.description = "How much stronger a lower pitch must be than a pitch on one of its harmonics for the latter to be discarded as an overtone.";
    desc.minValue = 1.01f;
    desc.maxValue = 4;
    desc.defaultValue = defaults.harmonicSupportRatio;
    desc.isQuantized = false;
    list.push_back(desc);

    desc.identifier = "persistence";
    desc.name = "Pitch persistence";
    desc.unit = "";
    desc.description = "Fraction of a note segment's frames in which a pitch must be a spectral peak for it to be reported.";
    desc.minValue = 0.05f;
    desc.maxValue = 1;
    desc.defaultValue = defaults.persistence;
    desc.isQuantized = false;
    list.push_back(desc);

    desc.identifier = "onsetthreshold";
    desc.name = "Onset threshold";
    desc.unit = "";
    desc.description = "Onset strength below which no onset is considered. Raise it to split the recording into fewer notes.";
    desc.minValue = 0;
    desc.maxValue = 10;
    desc.defaultValue = defaults.onsetThreshold;
    desc.isQuantized = false;
    list.push_back(desc);

    desc.identifier = "tempo";
    desc.name = "Tempo";
    desc.unit = "bpm";
    desc.description = "Tempo to quantize at. Zero means estimate it from the recording.";
    desc.minValue = 0;
    desc.maxValue = 300;
    desc.defaultValue = 0;
    desc.isQuantized = false;
    list.push_back(desc);

    return list;
}

float
Pianoscribe::getParameter(string identifier) const
{
    if (identifier == "harmonic") {
        return m_params.harmonicRefinement ? 1.f : 0.f;
    } else if (identifier == "supportratio") {
        return m_params.harmonicSupportRatio;
    } else if (identifier == "persistence") {
        return m_params.persistence;
    } else if (identifier == "onsetthreshold") {
        return m_params.onsetThreshold;
    } else if (identifier == "tempo") {
        return float(m_params.tempoOverride);
    }
    return 0;
}

void
Pianoscribe::setParameter(string identifier, float value) 
{
    if (identifier == "harmonic") {
        m_params.harmonicRefinement = (value > 0.5);
    } else if (identifier == "supportratio") {
        m_params.harmonicSupportRatio = value;
    } else if (identifier == "persistence") {
        m_params.persistence = value;
    } else if (identifier == "onsetthreshold") {
        m_params.onsetThreshold = value;
    } else if (identifier == "tempo") {
        m_params.tempoOverride = value;
    }
}

Pianoscribe::ProgramList
Pianoscribe::getPrograms() const
{
    ProgramList list;
    return list;
}

string
Pianoscribe::getCurrentProgram() const
{
    return ""; 
}

void
Pianoscribe::selectProgram(string)
{
}

Pianoscribe::OutputList
Pianoscribe::getOutputDescriptors() const
{
    OutputList list;

    float frameRate = float(m_params.targetSampleRate) / m_params.hopSize;

    OutputDescriptor d;
    d.identifier = "notes";
    d.name = "Detected notes";
    d.description = "Notes as detected, before quantization. Each note has time, duration, fundamental frequency, and a synthetic MIDI velocity (40-127) estimated from the strength of the pitch in its segment. Notes of a chord share time and duration.";
    d.unit = "Hz";
    d.hasFixedBinCount = true;
    d.binCount = 2;
    d.binNames.push_back("Frequency");
    d.binNames.push_back("Velocity");
    d.hasKnownExtents = false;
    d.isQuantized = false;
    d.sampleType = OutputDescriptor::VariableSampleRate;
    d.sampleRate = frameRate;
    d.hasDuration = true;
    m_notesOutputNo = list.size();
    list.push_back(d);

    d.identifier = "quantised";
    d.name = "Quantised notes";
    d.description = "The detected notes with start and end snapped to a sixteenth-note grid at the tempo in use. Notes ending at or before their start are extended to one sixteenth.";
    d.sampleRate = 0;
    m_quantisedOutputNo = list.size();
    list.push_back(d);

    d.identifier = "onsets";
    d.name = "Segment boundaries";
    d.description = "The onsets dividing the recording into note segments, followed by the end of the recording.";
    d.unit = "";
    d.binCount = 0;
    d.binNames.clear();
    d.sampleRate = frameRate;
    d.hasDuration = false;
    m_onsetsOutputNo = list.size();
    list.push_back(d);

    d.identifier = "tempo";
    d.name = "Tempo";
    d.description = "The single tempo used to convert times to beats.";
    d.unit = "bpm";
    d.binCount = 1;
    d.hasKnownExtents = true;
    d.minValue = 20;
    d.maxValue = 300;
    d.sampleRate = 0;
    m_tempoOutputNo = list.size();
    list.push_back(d);

    return list;
}

bool
Pianoscribe::initialise(size_t channels, size_t stepSize, size_t blockSize)
{
    if (m_inputSampleRate < minInputSampleRate ||
        m_inputSampleRate > maxInputSampleRate) {
	cerr << "Pianoscribe::initialise: Unsupported input sample rate "
             << m_inputSampleRate << " (supported min " << minInputSampleRate
             << ", max " << maxInputSampleRate << ")" << endl;
        return false;
    }

    if (channels < getMinChannelCount() ||
	channels > getMaxChannelCount()) {
	cerr << "Pianoscribe::initialise: Unsupported channel count " << channels
             << " (supported min " << getMinChannelCount() << ", max "
             << getMaxChannelCount() << ")" << endl;
        return false;
    }

    if (stepSize != blockSize) {
	cerr << "Pianoscribe::initialise: Step size must be the same as block size ("
	     << stepSize << " != " << blockSize << ")" << endl;
	return false;
    }

    vector<string> problems = m_params.validate();
    if (!problems.empty()) {
        for (int i = 0; i < int(problems.size()); ++i) {
            cerr << "Pianoscribe::initialise: " << problems[i] << endl;
        }
        return false;
    }

    m_blockSize = blockSize;

    reset();

    return true;
}

void
Pianoscribe::reset()
{
    m_input.clear();
    m_startTime = RealTime::zeroTime;
    m_haveStartTime = false;
}

Pianoscribe::FeatureSet
Pianoscribe::process(const float *const *inputBuffers, Vamp::RealTime timestamp)
{
    if (!m_haveStartTime) {
        m_startTime = timestamp;
        m_haveStartTime = true;
    }

    m_input.insert(m_input.end(), inputBuffers[0], inputBuffers[0] + m_blockSize);

    return FeatureSet();
}

Pianoscribe::Feature
Pianoscribe::makeNoteFeature(const NoteEvent &note) const
{
    Feature f;

    f.hasTimestamp = true;
    f.timestamp = m_startTime + RealTime::fromSeconds(note.start);

    f.hasDuration = true;
    f.duration = RealTime::fromSeconds(note.end - note.start);

    f.values.clear();
    f.values.push_back(float(PitchDetector::pitchToFrequency(note.pitch)));
    f.values.push_back(float(note.velocity));

    f.label = getPitchName(note.pitch);

    return f;
}

Pianoscribe::FeatureSet
Pianoscribe::getRemainingFeatures()
{
    FeatureSet fs;

    if (m_notesOutputNo < 0) {
        // outputs are numbered when first described
        (void)getOutputDescriptors();
    }

    Transcription t;
    try {
        Transcriber transcriber(m_params);
        t = transcriber.transcribe(AudioBuffer(m_input, int(lrintf(m_inputSampleRate))));
    } catch (const std::exception &e) {
        cerr << "Pianoscribe::getRemainingFeatures: transcription failed: "
             << e.what() << endl;
        return fs;
    }

    for (int i = 0; i < int(t.notes.size()); ++i) {
        fs[m_notesOutputNo].push_back(makeNoteFeature(t.notes[i]));
    }

    for (int i = 0; i < int(t.quantized.size()); ++i) {
        fs[m_quantisedOutputNo].push_back
            (makeNoteFeature(t.quantized[i].toNoteEvent()));
    }

    for (int i = 0; i < int(t.boundaries.size()); ++i) {
        Feature f;
        f.hasTimestamp = true;
        f.timestamp = m_startTime + RealTime::fromSeconds(t.boundaries[i]);
        fs[m_onsetsOutputNo].push_back(f);
    }

    Feature tempo;
    tempo.hasTimestamp = true;
    tempo.timestamp = m_startTime;
    tempo.values.push_back(float(t.tempo));
    fs[m_tempoOutputNo].push_back(tempo);

    return fs;
}
