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

#include "Transcriber.h"

#include "Decoder.h"
#include "ExternalTool.h"
#include "MidiExport.h"
#include "MusicXmlWriter.h"
#include "NotationBuilder.h"
#include "OnsetDetector.h"
#include "PitchDetector.h"
#include "Preprocessor.h"
#include "Renderer.h"
#include "RestCombiner.h"
#include "Synthesizer.h"
#include "TempoEstimator.h"
#include "TranscriptionErrors.h"

#include <iostream>
#include <sstream>
#include <stdexcept>

using std::string;
using std::vector;
using std::cerr;
using std::endl;

Transcriber::Transcriber(const TranscriptionParameters &params) :
    m_params(params),
    m_renderer(new MuseScoreRenderer()),
    m_synthesizer(new FluidSynthSynthesizer())
{
}

Transcriber::~Transcriber()
{
    delete m_renderer;
    delete m_synthesizer;
}

void
Transcriber::setRenderer(Renderer *renderer)
{
    if (renderer == m_renderer) return;
    delete m_renderer;
    m_renderer = renderer;
}

void
Transcriber::setSynthesizer(Synthesizer *synthesizer)
{
    if (synthesizer == m_synthesizer) return;
    delete m_synthesizer;
    m_synthesizer = synthesizer;
}

void
Transcriber::checkMeasures(const ScoreModel &score, bool unpadded)
{
    const Part *parts[] = { &score.treble, &score.bass };
    for (int p = 0; p < 2; ++p) {
        const vector<Measure> &mm = parts[p]->measures;
        for (int i = 0; i < int(mm.size()); ++i) {
            if (unpadded && i + 1 == int(mm.size())) break;
            if (!mm[i].isFull()) {
                std::ostringstream os;
                os << "Transcriber::checkMeasures: " << parts[p]->name
                   << " measure " << mm[i].number << " has length "
                   << mm[i].getQuarterLength() << " quarters";
                throw AnalysisError(os.str());
            }
        }
    }
}

Transcription
Transcriber::transcribe(const AudioBuffer &buffer,
                        string title,
                        string composer) const
{
    Transcription t;
    NotationBuilder builder(m_params);

    if (buffer.empty() || buffer.sampleRate <= 0) {
        t.tempo = clampTempo(m_params.tempoOverride > 0.0 ?
                             m_params.tempoOverride : defaultTempo);
        t.score = builder.build(t.quantized, t.tempo, title, composer);
        return t;
    }

    AudioBuffer working = resampleBuffer(buffer, m_params.targetSampleRate);
    int rate = working.sampleRate;

    if (m_params.preprocess) {
        Preprocessor preprocessor(m_params);
        working = preprocessor.process(working);
    }

    OnsetDetector onsets(rate, m_params);
    vector<double> strength = onsets.getStrength(working.samples);

    TempoEstimator estimator(rate, m_params);
    t.tempo = estimator.estimate(strength);

    Segmenter segmenter(rate, m_params, t.tempo);
    t.boundaries = segmenter.findBoundaries(strength, working.getDuration());
    t.segments = segmenter.segment(working, t.boundaries);

    PitchDetector detector(rate, m_params);
    detector.analyse(working.samples);
    t.notes = detector.detect(t.segments);

    Quantizer quantizer(m_params, t.tempo);
    t.quantized = quantizer.quantize(t.notes);

    t.score = builder.build(t.quantized, t.tempo, title, composer);

    if (m_params.combineRests) {
        combineRestsInScore(t.score);
    }

    checkMeasures(t.score, !m_params.padFinalMeasure);

    if (m_params.verbose) {
        cerr << "Transcriber::transcribe: " << working.getDuration()
             << "s at " << t.tempo << " BPM: " << t.segments.size()
             << " segments, " << t.notes.size() << " notes, "
             << t.score.treble.measures.size() << " measures" << endl;
    }

    return t;
}

string
Transcriber::getExportPath(const TranscriptionOutputs &outputs)
{
    if (outputs.exportPath != "") return outputs.exportPath;

    string doc = outputs.documentPath;
    string::size_type slash = doc.rfind('/');
    string::size_type dot = doc.rfind('.');
    if (dot != string::npos && (slash == string::npos || dot > slash)) {
        doc = doc.substr(0, dot);
    }
    return doc + ".mid";
}

Transcriber::Status
Transcriber::transcribeFile(string audioPath,
                            const TranscriptionOutputs &outputs)
{
    m_degradations.clear();

    vector<string> problems = m_params.validate();
    if (!problems.empty()) {
        throw std::invalid_argument("Transcriber::transcribeFile: invalid parameters: " +
                                    problems[0]);
    }
    if (outputs.documentPath == "") {
        throw std::invalid_argument("Transcriber::transcribeFile: no document path given");
    }

    TempArea area(outputs.tempRoot, outputs.requestId);

    Decoder decoder(m_params, &area);
    AudioBuffer buffer = decoder.decode(audioPath);

    m_last = transcribe(buffer, outputs.title, outputs.composer);

    MusicXmlWriter writer;
    writer.writeFile(m_last.score, outputs.documentPath);

    string exportPath = getExportPath(outputs);
    MidiExport exporter(m_last.tempo, m_params.ticksPerQuarter);
    exporter.addNotes(m_last.quantized);
    exporter.writeFile(exportPath);

    if (outputs.renderPath != "") {
        try {
            m_renderer->render(outputs.documentPath, outputs.renderPath);
        } catch (const RenderError &e) {
            cerr << "Transcriber::transcribeFile: rendering failed, continuing without it: "
                 << e.what() << endl;
            m_degradations.push_back(e.what());
        }
    }

    if (outputs.audioPath != "") {
        if (outputs.sampleBankPath == "") {
            string message = "Transcriber::transcribeFile: no sample bank given, skipping audio";
            cerr << message << endl;
            m_degradations.push_back(message);
        } else {
            try {
                m_synthesizer->synthesize(exportPath, outputs.sampleBankPath,
                                          outputs.audioPath);
            } catch (const SynthesisError &e) {
                cerr << "Transcriber::transcribeFile: synthesis failed, continuing without it: "
                     << e.what() << endl;
                m_degradations.push_back(e.what());
            }
        }
    }

    return m_degradations.empty() ? Success : DegradedSuccess;
}
