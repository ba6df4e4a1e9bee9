#pragma once
#include "config.hpp"
#include <cstddef>

constexpr int MIN_QR_VERSION = 1;

// Data codewords available in one symbol of this version/level.
int qr_data_codewords(int version, EccLevel ecc);

// Largest payload, in bytes, a byte-mode segment can carry at this version/level.
int qr_byte_capacity(int version, EccLevel ecc);

// Smallest version whose byte capacity holds `bytes`, or 0 when even version 40 can't.
int min_qr_version(std::size_t bytes, EccLevel ecc);
