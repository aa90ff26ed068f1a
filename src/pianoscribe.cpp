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
#include "TranscriptionErrors.h"
#include "TranscriptionParameters.h"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

using std::string;
using std::vector;
using std::cout;
using std::cerr;
using std::endl;

static void
usage(const char *program)
{
    cerr << "Usage: " << program << " [options] <audio-file> <output.musicxml>\n\n";
    cerr << "Transcribe a piano recording into two-staff notation.\n\n";
    cerr << "Options:\n";
    cerr << "  --title TEXT        Title written into the document\n";
    cerr << "  --composer TEXT     Composer written into the document\n";
    cerr << "  --midi FILE         Event export path (default: beside the document, .mid)\n";
    cerr << "  --pdf FILE          Also render the document to FILE with MuseScore\n";
    cerr << "  --wav FILE          Also synthesize the export to FILE with FluidSynth\n";
    cerr << "  --soundfont FILE    Sample bank for --wav\n";
    cerr << "  --tempo BPM         Quantize at this tempo instead of estimating it\n";
    cerr << "  --messy             Leave rests uncombined\n";
    cerr << "  --single-pitch      Report only the strongest pitch per segment\n";
    cerr << "  --no-harmonic       Keep pitches that look like overtones\n";
    cerr << "  --support-ratio R   Overtone support ratio (default 1.5)\n";
    cerr << "  --tmpdir DIR        Root for transient files (default $TMPDIR or /tmp)\n";
    cerr << "  --request-id ID     Name for this run's transient directory\n";
    cerr << "  --verbose           Log a summary line per stage\n";
    cerr << "  --help              Show this help\n";
}

static bool
parseNumber(const char *text, double &value)
{
    char *end = 0;
    value = strtod(text, &end);
    return end != text && *end == '\0';
}

int
main(int argc, char **argv)
{
    TranscriptionParameters params;
    TranscriptionOutputs outputs;
    vector<string> positional;

    for (int i = 1; i < argc; ++i) {

        string arg = argv[i];
        bool hasValue = (i + 1 < argc);

        if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--messy") {
            params.combineRests = false;
        } else if (arg == "--single-pitch") {
            params.singlePitch = true;
        } else if (arg == "--no-harmonic") {
            params.harmonicRefinement = false;
        } else if (arg == "--verbose") {
            params.verbose = true;
        } else if (arg.size() > 2 && arg.substr(0, 2) == "--") {
            if (!hasValue) {
                cerr << "Option " << arg << " requires a value" << endl;
                usage(argv[0]);
                return 1;
            }
            string value = argv[++i];
            if (arg == "--title") {
                outputs.title = value;
            } else if (arg == "--composer") {
                outputs.composer = value;
            } else if (arg == "--midi") {
                outputs.exportPath = value;
            } else if (arg == "--pdf") {
                outputs.renderPath = value;
            } else if (arg == "--wav") {
                outputs.audioPath = value;
            } else if (arg == "--soundfont") {
                outputs.sampleBankPath = value;
            } else if (arg == "--tmpdir") {
                outputs.tempRoot = value;
            } else if (arg == "--request-id") {
                outputs.requestId = value;
            } else if (arg == "--tempo" || arg == "--support-ratio") {
                double number = 0.0;
                if (!parseNumber(value.c_str(), number)) {
                    cerr << "Option " << arg << " requires a number, not \""
                         << value << "\"" << endl;
                    return 1;
                }
                if (arg == "--tempo") params.tempoOverride = number;
                else params.harmonicSupportRatio = float(number);
            } else {
                cerr << "Unknown option " << arg << endl;
                usage(argv[0]);
                return 1;
            }
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        usage(argv[0]);
        return 1;
    }

    vector<string> problems = params.validate();
    if (!problems.empty()) {
        for (int i = 0; i < int(problems.size()); ++i) {
            cerr << "Invalid setting: " << problems[i] << endl;
        }
        return 1;
    }

    outputs.documentPath = positional[1];

    Transcriber transcriber(params);
    Transcriber::Status status;

    try {
        status = transcriber.transcribeFile(positional[0], outputs);
    } catch (const EmptyInputError &e) {
        cerr << "Empty input: " << e.what() << endl;
        return 2;
    } catch (const DecodeError &e) {
        cerr << "Decode failed: " << e.what() << endl;
        return 2;
    } catch (const AnalysisError &e) {
        cerr << "Analysis failed: " << e.what() << endl;
        return 3;
    } catch (const OutputError &e) {
        cerr << "Output failed: " << e.what() << endl;
        return 3;
    } catch (const std::exception &e) {
        cerr << "Error: " << e.what() << endl;
        return 3;
    }

    const Transcription &t = transcriber.getLastTranscription();

    cout << "Wrote " << outputs.documentPath << " and "
         << Transcriber::getExportPath(outputs) << ": "
         << t.notes.size() << " notes, "
         << t.score.treble.measures.size() << " measures at "
         << t.tempo << " BPM" << endl;

    if (status == Transcriber::DegradedSuccess) {
        const vector<string> &d = transcriber.getDegradations();
        cout << "Completed with " << d.size()
             << " optional output(s) missing:" << endl;
        for (int i = 0; i < int(d.size()); ++i) {
            cout << "  " << d[i] << endl;
        }
    }

    return 0;
}
