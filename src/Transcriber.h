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

#ifndef PIANOSCRIBE_TRANSCRIBER_H
#define PIANOSCRIBE_TRANSCRIBER_H

#include "AudioBuffer.h"
#include "NoteEvent.h"
#include "Quantizer.h"
#include "ScoreModel.h"
#include "Segmenter.h"
#include "TranscriptionParameters.h"

#include <string>
#include <vector>

class Renderer;
class Synthesizer;

/**
 * Everything one run of the pipeline produces.
 */
struct Transcription
{
    Transcription() : tempo(0.0) { }

    ScoreModel score;
    double tempo;
    std::vector<double> boundaries;     // onsets and the final duration
    std::vector<OnsetSegment> segments; // accepted segments
    std::vector<NoteEvent> notes;
    std::vector<QuantizedNote> quantized;
};

/**
 * Where transcribeFile writes its results. Only the document path
 * is required. The export goes beside the document with a .mid
 * extension unless a path is given; the page image and audio are
 * produced only when their paths are set, and audio also needs a
 * sample bank.
 */
struct TranscriptionOutputs
{
    std::string documentPath;
    std::string exportPath;
    std::string renderPath;
    std::string audioPath;
    std::string sampleBankPath;

    std::string title;
    std::string composer;

    std::string tempRoot;       // default $TMPDIR or /tmp
    std::string requestId;      // default unique to the process and time
};

/**
 * The transcription pipeline, from decoded audio to notation:
 * preprocessing, tempo estimation, segmentation, pitch detection,
 * quantization, notation layout and rest combination, run in that
 * order on one thread. A Transcriber holds no state shared with any
 * other; use one per request.
 */
class Transcriber
{
public:
    enum Status { Success, DegradedSuccess };

    Transcriber(const TranscriptionParameters &params);
    ~Transcriber();

    /**
     * Transcribe a buffer. An empty buffer gives a score of one rest
     * measure per staff. Throws AnalysisError if the finished score
     * has a measure that is not one bar long.
     */
    Transcription transcribe(const AudioBuffer &buffer,
                             std::string title = "",
                             std::string composer = "") const;

    /**
     * Decode, transcribe and write the document and export, then run
     * the renderer and synthesizer for whichever outputs were asked
     * for. Failures of those two are logged and reported as
     * DegradedSuccess. Decode and output failures are thrown.
     */
    Status transcribeFile(std::string audioPath,
                          const TranscriptionOutputs &outputs);

    /**
     * Replace the renderer. The transcriber takes ownership.
     */
    void setRenderer(Renderer *renderer);

    /**
     * Replace the synthesizer. The transcriber takes ownership.
     */
    void setSynthesizer(Synthesizer *synthesizer);

    const Transcription &getLastTranscription() const { return m_last; }

    /// Reasons for the most recent DegradedSuccess
    const std::vector<std::string> &getDegradations() const {
        return m_degradations;
    }

    /**
     * Throw AnalysisError if any measure of either part is not one
     * bar long. The final measure is exempt if unpadded is set.
     */
    static void checkMeasures(const ScoreModel &score, bool unpadded);

    static std::string getExportPath(const TranscriptionOutputs &outputs);

private:
    TranscriptionParameters m_params;
    Renderer *m_renderer;
    Synthesizer *m_synthesizer;
    Transcription m_last;
    std::vector<std::string> m_degradations;

    Transcriber(const Transcriber &); // not provided
    Transcriber &operator=(const Transcriber &); // not provided
};

#endif
