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

#ifndef PIANOSCRIBE_SYNTHESIZER_H
#define PIANOSCRIBE_SYNTHESIZER_H

#include <string>

/**
 * Turns the event export into audio using an instrument sample
 * bank. Implementations throw SynthesisError on failure.
 */
class Synthesizer
{
public:
    virtual ~Synthesizer() { }

    virtual void synthesize(std::string exportPath,
                            std::string sampleBankPath,
                            std::string outputPath) = 0;
};

/**
 * Synthesizes with FluidSynth in fast-render mode:
 * "fluidsynth -ni -g 5 -F <output> <bank> <export>".
 */
class FluidSynthSynthesizer : public Synthesizer
{
public:
    FluidSynthSynthesizer(std::string program = "fluidsynth");
    virtual ~FluidSynthSynthesizer();

    virtual void synthesize(std::string exportPath,
                            std::string sampleBankPath,
                            std::string outputPath);

    static const int gain = 5;

private:
    std::string m_program;
};

#endif
