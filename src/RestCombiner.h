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

#ifndef PIANOSCRIBE_REST_COMBINER_H
#define PIANOSCRIBE_REST_COMBINER_H

#include "ScoreModel.h"

#include <string>
#include <vector>

/**
 * Consolidation of the rests in full measures. Occupancy is taken
 * as a mask of sixteen slots, true where a note or chord sounds.
 * The empty slots are then covered with the coarsest aligned rests
 * available: a whole rest if the measure is empty, otherwise the
 * halves are considered in turn, then quarters, eighths and single
 * slots. Notes keep their positions and are copied unchanged.
 */
class RestCombiner
{
public:
    typedef std::vector<bool> RestMask;

    /**
     * Return the occupancy mask of a full measure.
     */
    static RestMask getMask(const Measure &measure);

    /**
     * Return the empty spans of the mask as (start, length) pairs
     * in ascending order, each aligned to its own length.
     */
    static std::vector<std::pair<int, int> > foldMask(const RestMask &mask);

    /**
     * Return the measure with its rests combined. Measures that are
     * not exactly one bar long are returned unchanged. Throws
     * AnalysisError, naming the staff and measure, if the rebuilt
     * measure does not add up to one bar.
     */
    static Measure combine(const Measure &measure, std::string staff);

private:
    static void fold(const RestMask &mask, int start, int length,
                     std::vector<std::pair<int, int> > &spans);
};

/**
 * Combine the rests of every measure of both parts.
 */
void combineRestsInScore(ScoreModel &score);

#endif
