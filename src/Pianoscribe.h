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

#ifndef PIANOSCRIBE_H
#define PIANOSCRIBE_H

#include <vamp-sdk/Plugin.h>

#include <vector>
#include <string>

#include "TranscriptionParameters.h"

using std::string;
using std::vector;

struct NoteEvent;

class Pianoscribe : public Vamp::Plugin
{
public:
    Pianoscribe(float inputSampleRate);
    virtual ~Pianoscribe();

    string getIdentifier() const;
    string getName() const;
    string getDescription() const;
    string getMaker() const;
    int getPluginVersion() const;
    string getCopyright() const;

    InputDomain getInputDomain() const;
    size_t getPreferredBlockSize() const;
    size_t getPreferredStepSize() const;
    size_t getMinChannelCount() const;
    size_t getMaxChannelCount() const;

    ParameterList getParameterDescriptors() const;
    float getParameter(string identifier) const;
    void setParameter(string identifier, float value);

    ProgramList getPrograms() const;
    string getCurrentProgram() const;
    void selectProgram(string name);

    OutputList getOutputDescriptors() const;

    bool initialise(size_t channels, size_t stepSize, size_t blockSize);
    void reset();

    FeatureSet process(const float *const *inputBuffers,
                       Vamp::RealTime timestamp);

    FeatureSet getRemainingFeatures();

protected:
    TranscriptionParameters m_params;

    int m_blockSize;
    vector<float> m_input;
    Vamp::RealTime m_startTime;
    bool m_haveStartTime;

    Feature makeNoteFeature(const NoteEvent &note) const;

    mutable int m_notesOutputNo;
    mutable int m_quantisedOutputNo;
    mutable int m_onsetsOutputNo;
    mutable int m_tempoOutputNo;
};

#endif
