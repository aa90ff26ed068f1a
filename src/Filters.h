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

#ifndef PIANOSCRIBE_FILTERS_H
#define PIANOSCRIBE_FILTERS_H

#include <vector>

/**
 * Second-order IIR section, transposed direct form II, with the RBJ
 * cookbook designs for the shapes we need.
 */
class Biquad
{
public:
    Biquad();

    static Biquad lowPass(double sampleRate, double frequency, double q);
    static Biquad highPass(double sampleRate, double frequency, double q);
    static Biquad lowShelf(double sampleRate, double frequency,
                           double gainDb, double q);

    double process(double x) {
        double y = m_b0 * x + m_z1;
        m_z1 = m_b1 * x - m_a1 * y + m_z2;
        m_z2 = m_b2 * x - m_a2 * y;
        return y;
    }

    void reset() { m_z1 = m_z2 = 0.0; }

private:
    Biquad(double b0, double b1, double b2, double a0, double a1, double a2);

    double m_b0, m_b1, m_b2, m_a1, m_a2;
    double m_z1, m_z2;
};

/**
 * Butterworth band-pass as a cascade of a high-pass and a low-pass
 * of the given order (even), applied forwards and backwards for zero
 * phase.
 */
class ButterworthBandPass
{
public:
    ButterworthBandPass(double sampleRate, double low, double high, int order);

    std::vector<float> filtfilt(const std::vector<float> &in) const;

private:
    std::vector<Biquad> m_sections;
    int m_order;

    void run(std::vector<double> &data) const;
};

#endif
