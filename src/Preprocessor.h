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

#ifndef PIANOSCRIBE_PREPROCESSOR_H
#define PIANOSCRIBE_PREPROCESSOR_H

#include "AudioBuffer.h"
#include "TranscriptionParameters.h"

/**
 * Conditioning ahead of analysis, as a fixed sequence of stages:
 * peak normalisation, stationary noise reduction, dynamics shaping,
 * harmonic separation and a zero-phase band-pass. The output has the
 * same rate and length as the input, and the same input always gives
 * the same output.
 */
class Preprocessor
{
public:
    Preprocessor(const TranscriptionParameters &params);
    ~Preprocessor();

    AudioBuffer process(const AudioBuffer &in) const;

    static void normalise(std::vector<float> &samples);

private:
    TranscriptionParameters m_params;
};

#endif
