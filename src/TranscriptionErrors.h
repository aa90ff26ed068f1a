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

#ifndef PIANOSCRIBE_TRANSCRIPTION_ERRORS_H
#define PIANOSCRIBE_TRANSCRIPTION_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * All decode strategies failed. The message cites the last
 * underlying cause.
 */
class DecodeError : public std::runtime_error
{
public:
    DecodeError(std::string what) : std::runtime_error(what) { }
};

/**
 * The source has no duration: zero bytes on disc, or zero frames
 * once decoded.
 */
class EmptyInputError : public std::runtime_error
{
public:
    EmptyInputError(std::string what) : std::runtime_error(what) { }
};

/**
 * An internal invariant of the analysis was violated, for example a
 * measure whose rebuilt durations do not sum to one bar.
 */
class AnalysisError : public std::runtime_error
{
public:
    AnalysisError(std::string what) : std::runtime_error(what) { }
};

/**
 * The notation document or event export could not be written.
 */
class OutputError : public std::runtime_error
{
public:
    OutputError(std::string what) : std::runtime_error(what) { }
};

class RenderError : public std::runtime_error
{
public:
    RenderError(std::string what) : std::runtime_error(what) { }
};

class SynthesisError : public std::runtime_error
{
public:
    SynthesisError(std::string what) : std::runtime_error(what) { }
};

#endif
