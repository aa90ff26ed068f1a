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

#ifndef PIANOSCRIBE_MUSICXML_WRITER_H
#define PIANOSCRIBE_MUSICXML_WRITER_H

#include "ScoreModel.h"

#include <ostream>
#include <string>

/**
 * Serialise a ScoreModel as a MusicXML 3.1 partwise document, with
 * four divisions per quarter note so that every element duration is
 * its length in sixteenth steps.
 */
class MusicXmlWriter
{
public:
    MusicXmlWriter();
    ~MusicXmlWriter();

    void write(const ScoreModel &score, std::ostream &out) const;

    std::string toString(const ScoreModel &score) const;

    /**
     * Write the document to a file. Throws OutputError on failure.
     */
    void writeFile(const ScoreModel &score, std::string path) const;

    static std::string escape(std::string text);

private:
    void writePart(const Part &part, double tempo, std::ostream &out) const;
    void writeElement(const ScoreElement &e, bool wholeRest,
                      std::ostream &out) const;
};

#endif
