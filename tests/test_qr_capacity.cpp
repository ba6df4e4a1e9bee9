#include <doctest/doctest.h>
#include "qr_capacity.hpp"

TEST_CASE("Byte-mode capacity matches the published table") {
    CHECK(qr_byte_capacity(1, EccLevel::L) == 17);
    CHECK(qr_byte_capacity(1, EccLevel::H) == 7);
    CHECK(qr_byte_capacity(10, EccLevel::L) == 271);
    CHECK(qr_byte_capacity(40, EccLevel::L) == 2953);
    CHECK(qr_byte_capacity(40, EccLevel::H) == 1273);
}

TEST_CASE("Smallest fitting version") {
    CHECK(min_qr_version(0, EccLevel::L) == 1);
    CHECK(min_qr_version(17, EccLevel::L) == 1);
    CHECK(min_qr_version(18, EccLevel::L) == 2);
    CHECK(min_qr_version(2953, EccLevel::L) == 40);
    CHECK(min_qr_version(2954, EccLevel::L) == 0);
}

TEST_CASE("Versions outside 1..40 are rejected") {
    CHECK_THROWS(qr_data_codewords(0, EccLevel::L));
    CHECK_THROWS(qr_data_codewords(41, EccLevel::L));
}
