#ifndef QIM_HPP
#define QIM_HPP

#include <cstdint>

namespace dwtstego {

    // Quantization index modulation: a bit is the parity of round(c / Q).
    //
    // embedBit moves c to the nearest multiple of Q and, if the parity is
    // wrong, one step further up. extractBit reads the parity back. Any
    // additive noise below Q/2 leaves the bit intact; beyond that it is a
    // noisy channel whose error rate grows with noise / Q.
    //
    // Levels are kept in double. When |c / Q| reaches 2^53 the parity can no
    // longer be represented: embedBit returns c unchanged and extractBit
    // reads 0.
    double embedBit(double coeff, uint8_t bit, double step);

    uint8_t extractBit(double coeff, double step);

}

#endif
