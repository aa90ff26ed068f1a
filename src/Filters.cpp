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

#include "Filters.h"

#include <algorithm>
#include <cmath>

using std::vector;

Biquad::Biquad() :
    m_b0(1.0), m_b1(0.0), m_b2(0.0), m_a1(0.0), m_a2(0.0),
    m_z1(0.0), m_z2(0.0)
{
}

Biquad::Biquad(double b0, double b1, double b2,
               double a0, double a1, double a2) :
    m_b0(b0 / a0), m_b1(b1 / a0), m_b2(b2 / a0),
    m_a1(a1 / a0), m_a2(a2 / a0),
    m_z1(0.0), m_z2(0.0)
{
}

Biquad
Biquad::lowPass(double sampleRate, double frequency, double q)
{
    double w0 = 2.0 * M_PI * frequency / sampleRate;
    double alpha = sin(w0) / (2.0 * q);
    double c = cos(w0);
    return Biquad((1.0 - c) / 2.0, 1.0 - c, (1.0 - c) / 2.0,
                  1.0 + alpha, -2.0 * c, 1.0 - alpha);
}

Biquad
Biquad::highPass(double sampleRate, double frequency, double q)
{
    double w0 = 2.0 * M_PI * frequency / sampleRate;
    double alpha = sin(w0) / (2.0 * q);
    double c = cos(w0);
    return Biquad((1.0 + c) / 2.0, -(1.0 + c), (1.0 + c) / 2.0,
                  1.0 + alpha, -2.0 * c, 1.0 - alpha);
}

Biquad
Biquad::lowShelf(double sampleRate, double frequency, double gainDb, double q)
{
    double a = pow(10.0, gainDb / 40.0);
    double w0 = 2.0 * M_PI * frequency / sampleRate;
    double alpha = sin(w0) / (2.0 * q);
    double c = cos(w0);
    double sa = 2.0 * sqrt(a) * alpha;
    return Biquad(a * ((a + 1.0) - (a - 1.0) * c + sa),
                  2.0 * a * ((a - 1.0) - (a + 1.0) * c),
                  a * ((a + 1.0) - (a - 1.0) * c - sa),
                  (a + 1.0) + (a - 1.0) * c + sa,
                  -2.0 * ((a - 1.0) + (a + 1.0) * c),
                  (a + 1.0) + (a - 1.0) * c - sa);
}

ButterworthBandPass::ButterworthBandPass(double sampleRate,
                                         double low, double high,
                                         int order) :
    m_order(order)
{
    // Pole-pair Qs of an order-n Butterworth prototype
    int pairs = order / 2;
    for (int k = 0; k < pairs; ++k) {
        double q = 1.0 / (2.0 * cos(M_PI * (2 * k + 1) / (2.0 * order)));
        m_sections.push_back(Biquad::highPass(sampleRate, low, q));
        m_sections.push_back(Biquad::lowPass(sampleRate, high, q));
    }
}

void
ButterworthBandPass::run(vector<double> &data) const
{
    for (int s = 0; s < int(m_sections.size()); ++s) {
        Biquad section(m_sections[s]);
        section.reset();
        for (int i = 0; i < int(data.size()); ++i) {
            data[i] = section.process(data[i]);
        }
    }
}

vector<float>
ButterworthBandPass::filtfilt(const vector<float> &in) const
{
    int n = int(in.size());
    if (n == 0) return vector<float>();

    // Odd extension at either end, as scipy does, to tame the edges
    int pad = std::min(n - 1, 3 * (2 * m_order + 1));

    vector<double> data(n + 2 * pad);
    for (int i = 0; i < pad; ++i) {
        data[i] = 2.0 * in[0] - in[pad - i];
        data[n + pad + i] = 2.0 * in[n - 1] - in[n - 2 - i];
    }
    for (int i = 0; i < n; ++i) {
        data[pad + i] = in[i];
    }

    run(data);
    std::reverse(data.begin(), data.end());
    run(data);
    std::reverse(data.begin(), data.end());

    vector<float> out(n);
    for (int i = 0; i < n; ++i) {
        out[i] = float(data[pad + i]);
    }
    return out;
}
