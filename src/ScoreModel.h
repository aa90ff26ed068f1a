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

#ifndef PIANOSCRIBE_SCORE_MODEL_H
#define PIANOSCRIBE_SCORE_MODEL_H

#include <string>
#include <vector>

/// Sixteenth-note steps in one 4/4 measure
static const int stepsPerMeasure = 16;

/// Grid steps per quarter note in notation
static const int notationStepsPerQuarter = 4;

/**
 * A note, chord or rest occupying a whole number of sixteenth-note
 * steps. A note has one pitch, a chord several, a rest none.
 */
struct ScoreElement
{
    enum Kind { Note, Chord, Rest };

    ScoreElement() : kind(Rest), steps(0), tieStart(false), tieStop(false) { }

    Kind kind;
    std::vector<int> pitches;   // ascending
    int steps;
    bool tieStart;
    bool tieStop;

    static ScoreElement makeRest(int steps);

    /// A note for one pitch, a chord for more; pitches are sorted
    static ScoreElement makeSounding(std::vector<int> pitches, int steps);

    bool isRest() const { return kind == Rest; }

    double getQuarterLength() const {
        return double(steps) / notationStepsPerQuarter;
    }

    /**
     * Return the written duration class: "16th", "eighth",
     * "quarter", "half" or "whole". A length of one and a half times
     * a class is written dotted; any other length that is not a
     * class takes the nearest one.
     */
    std::string getTypeName() const;
    bool isDotted() const;

    bool operator==(const ScoreElement &e) const {
        return kind == e.kind && pitches == e.pitches && steps == e.steps &&
            tieStart == e.tieStart && tieStop == e.tieStop;
    }
    bool operator!=(const ScoreElement &e) const { return !(*this == e); }
};

struct Measure
{
    Measure() : number(0) { }
    explicit Measure(int n) : number(n) { }

    int number;                 // from 1
    std::vector<ScoreElement> elements;

    int getTotalSteps() const;
    double getQuarterLength() const {
        return double(getTotalSteps()) / notationStepsPerQuarter;
    }
    bool isFull() const { return getTotalSteps() == stepsPerMeasure; }
    bool isWholeRest() const {
        return elements.size() == 1 && elements[0].isRest() &&
            elements[0].steps == stepsPerMeasure;
    }
};

struct Part
{
    Part() : clefLine(0) { }

    std::string id;
    std::string name;
    std::string clefSign;
    int clefLine;
    std::vector<Measure> measures;

    static Part makeTreble();
    static Part makeBass();
};

/**
 * Two-staff piano notation in 4/4 with C major key, tempo and
 * descriptive metadata.
 */
struct ScoreModel
{
    ScoreModel();

    std::string title;
    std::string composer;
    double tempo;
    Part treble;
    Part bass;
};

/**
 * Spell a MIDI pitch with the fixed table C, C#, D, E-, E, F, F#, G,
 * G#, A, B-, B. The step is a letter, alter is -1, 0 or 1, and the
 * octave is pitch / 12 - 1.
 */
void spellPitch(int pitch, std::string &step, int &alter, int &octave);

/**
 * Return a pitch name such as "C4", "C#4" or "B-3".
 */
std::string getPitchName(int pitch);

#endif
