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

#ifndef PIANOSCRIBE_AUDIO_BUFFER_H
#define PIANOSCRIBE_AUDIO_BUFFER_H

#include <vector>

/**
 * A mono run of samples at a single rate. Peak amplitude is at most
 * 1.0 once the Decoder has produced it.
 */
struct AudioBuffer
{
    AudioBuffer() : sampleRate(0) { }
    AudioBuffer(std::vector<float> s, int rate) :
        samples(s), sampleRate(rate) { }

    std::vector<float> samples;
    int sampleRate;

    double getDuration() const {
        if (sampleRate <= 0) return 0.0;
        return double(samples.size()) / sampleRate;
    }

    bool empty() const { return samples.empty(); }
};

#endif
