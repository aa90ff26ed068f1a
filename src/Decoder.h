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

#ifndef PIANOSCRIBE_DECODER_H
#define PIANOSCRIBE_DECODER_H

#include "AudioBuffer.h"
#include "TranscriptionParameters.h"

#include <functional>
#include <string>
#include <vector>

class TempArea;

/**
 * Load an audio file into a mono, peak-limited AudioBuffer. Several
 * independent strategies are tried in a fixed order and the first to
 * succeed wins:
 *
 *  1. native decode through libsndfile, at the file's own rate
 *  2. libsndfile decode resampled to the target rate
 *  3. direct read of a RIFF/WAVE header and PCM data, tolerating the
 *     broken chunk sizes written by streaming recorders
 *  4. transcode with ffmpeg to 16-bit mono WAV at the target rate in
 *     a transient file, then read that
 *  5. scan for a known container signature past leading junk (such
 *     as a tag block) and decode from there
 *
 * Each failure is logged. If all fail, DecodeError is thrown citing
 * the last cause.
 */
class Decoder
{
public:
    /**
     * The temp area is used for transcoding and must outlive the
     * decoder. If it is null, transcoding is skipped.
     */
    Decoder(const TranscriptionParameters &params, const TempArea *tempArea);
    ~Decoder();

    /**
     * Decode the given file. Throws DecodeError if no strategy
     * succeeds, or EmptyInputError if the file is empty or decodes
     * to no frames at all.
     */
    AudioBuffer decode(std::string path) const;

    /**
     * Interleaved frames as produced by a single strategy, before
     * mixdown and normalisation.
     */
    struct Decoded {
        Decoded() : channels(0), sampleRate(0) { }
        std::vector<float> data;
        int channels;
        int sampleRate;
    };

    typedef std::function<Decoded(const std::string &)> Strategy;

    struct NamedStrategy {
        std::string name;
        Strategy strategy;
    };

    std::vector<NamedStrategy> getStrategies() const;

    /**
     * Try each strategy in turn on the given path, returning the
     * mixed-down and normalised result of the first that succeeds.
     */
    static AudioBuffer decodeWith(const std::vector<NamedStrategy> &strategies,
                                  std::string path);

    /**
     * Average interleaved channels to mono, and scale down to unit
     * peak if the peak exceeds 1.
     */
    static AudioBuffer finalise(const Decoded &decoded);

    static Decoded readNative(std::string path);
    static Decoded readRawWave(std::string path);
    static Decoded readContainerScan(std::string path);
    Decoded readResampled(std::string path) const;
    Decoded readTranscoded(std::string path) const;

    /**
     * Return an ffmpeg input format name guessed from the first bytes
     * of the file, or an empty string if unrecognised.
     */
    static std::string detectFormat(std::string path);

private:
    TranscriptionParameters m_params;
    const TempArea *m_tempArea;
};

/**
 * Resample a mono buffer to the given rate. Returns the input
 * unchanged if it is already at that rate.
 */
AudioBuffer resampleBuffer(const AudioBuffer &in, int targetRate);

#endif
